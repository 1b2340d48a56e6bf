#pragma once

#include <string>
#include <chrono>
#include <cstddef>
#include <ostream>
#include <utility>
#include <variant>
#include <optional>

namespace progressmux
{
  // Worker ids are 1-based. Offset 0 is reserved for the aggregate bar.
  //
  using worker_id = std::size_t;

  // Update messages.
  //
  // The set of alternatives is closed: consumers visit every one of them, so
  // adding a new kind of update is a compile error until every consumer loop
  // handles it.
  //
  struct next_update {};

  struct value_update
  {
    std::size_t value {0};
  };

  struct finish_update {};
  struct cancel_update {};

  struct describe_update
  {
    std::string description;
  };

  struct color_update
  {
    std::string color;
  };

  using update_message = std::variant<next_update,
                                      value_update,
                                      finish_update,
                                      cancel_update,
                                      describe_update,
                                      color_update>;

  // Update addressed to one worker of a multi-progress coordinator.
  //
  struct worker_update
  {
    worker_id id {0};
    update_message message;

    worker_update () = default;

    worker_update (worker_id i, update_message m)
      : id (i), message (std::move (m))
    {
    }
  };

  inline std::ostream&
  operator<< (std::ostream& os, const update_message& m)
  {
    struct printer
    {
      std::ostream& os;

      void operator() (const next_update&)   const {os << "next";}
      void operator() (const finish_update&) const {os << "finish";}
      void operator() (const cancel_update&) const {os << "cancel";}

      void operator() (const value_update& u) const
      {
        os << "value(" << u.value << ')';
      }

      void operator() (const describe_update& u) const
      {
        os << "describe(\"" << u.description << "\")";
      }

      void operator() (const color_update& u) const
      {
        os << "color(\"" << u.color << "\")";
      }
    };

    std::visit (printer {os}, m);
    return os;
  }

  inline std::ostream&
  operator<< (std::ostream& os, const worker_update& u)
  {
    return os << '#' << u.id << ' ' << u.message;
  }

  // Resolved tracker configuration.
  //
  // Passed through to the tracker constructor untouched. The coordinators
  // only ever read `enabled` and `output` themselves (to emit the trailing
  // newlines once all the bars are done).
  //
  struct progress_config
  {
    std::string description;
    std::string color;                 // Color name, empty for default.
    bool enabled {true};
    std::ostream* output {nullptr};    // Null means std::cerr.
    std::size_t line_width {80};
    std::chrono::milliseconds min_interval {100};

    std::ostream&
    stream () const;
  };

  // Partial configuration.
  //
  // Every field is optional so that per-worker options can override the
  // shared ones field by field.
  //
  struct progress_options
  {
    std::optional<std::string> description;
    std::optional<std::string> color;
    std::optional<bool> enabled;
    std::optional<std::ostream*> output;
    std::optional<std::size_t> line_width;
    std::optional<std::chrono::milliseconds> min_interval;
  };

  // Overlay `over` on top of `base`: set fields of `over` win.
  //
  progress_options
  merge (const progress_options& base, const progress_options& over);

  // Fill unset fields with defaults.
  //
  progress_config
  resolve (const progress_options&);
}
