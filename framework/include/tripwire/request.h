#ifndef TRIPWIRE_REQUEST_H
#define TRIPWIRE_REQUEST_H

#include <string>
#include <boost/beast/http/fields.hpp>

namespace tripwire {

/**
 * @brief The slice of an HTTP request the breaker middleware sees.
 * Populated by the serving layer.
 */
struct Request {
    std::string method = "GET";
    std::string path = "/";
    std::string body;
    boost::beast::http::fields headers;
};

} // namespace tripwire

#endif
