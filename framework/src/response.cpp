#include <tripwire/response.h>
#include <boost/beast/http/status.hpp>
#include <boost/json/src.hpp>
#include <sstream>

namespace tripwire {

Response::Response() : status_code_(200) {
}

Response& Response::status(int code) {
    status_code_ = code;
    return *this;
}

Response& Response::header(const std::string& key, const std::string& value) {
    headers_.set(key, value);
    return *this;
}

Response& Response::send(const std::string& text) {
    body_ = text;
    return *this;
}

Response& Response::json(const boost::json::value& data) {
    header("Content-Type", "application/json");
    body_ = boost::json::serialize(data);
    return *this;
}

int Response::get_status() const {
    return status_code_;
}

std::string_view Response::get_header(std::string_view key) const {
    auto it = headers_.find(key);
    if (it == headers_.end()) {
        return {};
    }
    return it->value();
}

std::string Response::build_response() const {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status_code_ << " "
        << boost::beast::http::obsolete_reason(boost::beast::http::int_to_status(status_code_)) << "\r\n";

    for (const auto& field : headers_) {
        oss << field.name_string() << ": " << field.value() << "\r\n";
    }

    if (headers_.find("Content-Length") == headers_.end()) {
        oss << "Content-Length: " << body_.length() << "\r\n";
    }

    oss << "\r\n";
    oss << body_;
    return oss.str();
}

} // namespace tripwire
