namespace scs
{
  template <typename T>
  inline void basic_http_session<T>::
  configure_ssl ()
  {
    if (!traits_.ssl_cert_file.empty ())
      ssl_ctx_.load_verify_file (traits_.ssl_cert_file);
    else
      ssl_ctx_.set_default_verify_paths ();

    ssl_ctx_.set_verify_mode (traits_.verify_ssl
                              ? ssl::verify_peer
                              : ssl::verify_none);

    ssl_ctx_.set_options (ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::single_dh_use);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  request (const request_type& req)
  {
    co_return co_await request_impl (req, 0);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  stream (const request_type& req, body_callback body, header_callback header)
  {
    co_return co_await perform (req,
                                nullptr,
                                0,
                                body ? &body : nullptr,
                                header ? &header : nullptr);
  }

  template <typename T>
  inline asio::awaitable<typename basic_http_client<T>::response_type>
  basic_http_client<T>::
  upload (const request_type& req, std::uint64_t size, read_function read)
  {
    co_return co_await perform (req, &read, size, nullptr);
  }
}
