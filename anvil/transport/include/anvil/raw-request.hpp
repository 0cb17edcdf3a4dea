#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>

namespace anvil {

// A request as delivered by the transport: the fully read Beast message (request line, header fields, body)
// and the endpoint of the peer that sent it.
// It is moved into the dispatch callback and consumed by AdaptRequest.
struct RawRequest {
  using Message = boost::beast::http::request<boost::beast::http::string_body>;

  Message message;
  boost::asio::ip::tcp::endpoint remoteEndpoint;
};

}  // namespace anvil
