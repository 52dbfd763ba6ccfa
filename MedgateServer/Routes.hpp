#pragma once
#include <boost/beast/http/string_body.hpp>

namespace Medgate
{
struct ServerContext;
}

namespace Medgate::Http
{
class Responder;

using Request = boost::beast::http::request<boost::beast::http::string_body>;

// Answers one request. Errors that happen before anything was written are
// turned into {error} JSON responses.
void handleRequest(ServerContext& ctx, const Request& req, Responder& out);
}
