namespace grab
{
  template <typename T>
  inline void basic_http_client<T>::
  configure_ssl ()
  {
    // If the certificate file is specified, use that. Otherwise fall back to
    // the system default verify paths.
    //
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
  inline asio::awaitable<http_stream> basic_http_client<T>::
  perform (http_request req, cancel_scope scope)
  {
    co_return co_await perform_impl (std::move (req), scope, 0);
  }
}
