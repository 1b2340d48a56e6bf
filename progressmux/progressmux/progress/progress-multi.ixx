namespace progressmux
{
  template <typename C>
  inline bool basic_worker_handle<C>::
  next ()
  {
    return send (next_update {});
  }

  template <typename C>
  inline bool basic_worker_handle<C>::
  set_value (std::size_t n)
  {
    return send (value_update {n});
  }

  template <typename C>
  inline bool basic_worker_handle<C>::
  finish ()
  {
    return send (finish_update {});
  }

  template <typename C>
  inline bool basic_worker_handle<C>::
  cancel ()
  {
    return send (cancel_update {});
  }

  template <typename C>
  inline bool basic_worker_handle<C>::
  describe (std::string d)
  {
    return send (describe_update {std::move (d)});
  }

  template <typename C>
  inline bool basic_worker_handle<C>::
  recolor (std::string c)
  {
    return send (color_update {std::move (c)});
  }

  // Return false if the coordinator is already done, in which case the
  // update is dropped.
  //
  template <typename C>
  inline bool basic_worker_handle<C>::
  send (update_message m)
  {
    return channel_->send (worker_update (id_, std::move (m)));
  }
}
