#ifndef TRIPWIRE_RESPONSE_H
#define TRIPWIRE_RESPONSE_H

#include <string>
#include <string_view>
#include <boost/beast/http/fields.hpp>
#include <boost/json.hpp>

namespace tripwire {

class Response {
private:
    int status_code_;
    boost::beast::http::fields headers_;
    std::string body_;

public:
    Response();

    Response& status(int code);
    Response& header(const std::string& key, const std::string& value);
    Response& send(const std::string& text);
    Response& json(const boost::json::value& data);

    int get_status() const;
    const std::string& body() const { return body_; }
    std::string_view get_header(std::string_view key) const;

    /** @brief Serializes status line, headers and body as HTTP/1.1. */
    std::string build_response() const;
};

} // namespace tripwire

#endif
