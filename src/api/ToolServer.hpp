#pragma once

#include <iosfwd>
#include <memory>
#include <optional>
#include <string>

#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

namespace gridimg::app {
class RenderService;
}

namespace gridimg::api {

// Line-delimited JSON-RPC 2.0 tool server. One request per line on the input
// stream, one response per line on the output stream; notifications get no reply.
class ToolServer {
public:
    static constexpr const char* kProtocolVersion = "2024-11-05";

    explicit ToolServer(std::shared_ptr<const app::RenderService> service);

    // Serves until the input stream reaches EOF.
    int run(std::istream& in, std::ostream& out);

    std::optional<std::string> handleLine(const std::string& line);
    std::optional<boost::json::value> handleMessage(const boost::json::value& message);

    bool initialized() const noexcept { return initialized_; }

private:
    boost::json::value dispatch_(const std::string& method, const boost::json::value& params, const boost::json::value& id);

    boost::json::value initialize_(const boost::json::value& params, const boost::json::value& id);
    boost::json::value listTools_(const boost::json::value& id) const;
    boost::json::value callTool_(const boost::json::value& params, const boost::json::value& id) const;
    boost::json::value setLogLevel_(const boost::json::value& params, const boost::json::value& id) const;

    std::shared_ptr<const app::RenderService> service_;
    bool initialized_ = false;
};

}  // namespace gridimg::api
