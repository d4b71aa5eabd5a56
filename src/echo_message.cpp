#include "echo_message.hpp"
#include "trace_errors.hpp"
#include "uuid.hpp"

#include <memory>

namespace zt
{
    namespace
    {
        const char *kLatencyType = "ws-latency";
        const char *kFinalType = "ws-final";
    } // namespace

    EchoMessage parse_echo_message(const std::string &text)
    {
        Json::CharReaderBuilder builder;
        builder["failIfExtra"] = true;
        std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

        Json::Value j;
        std::string errs;
        if (!reader->parse(text.data(), text.data() + text.size(), &j, &errs))
            throw MessageFormatError("echo message is not JSON: " + errs);
        if (!j.isObject())
            throw MessageFormatError("echo message is not a JSON object");

        std::string type;
        if (j.isMember("type"))
        {
            if (!j["type"].isString())
                throw MessageFormatError("echo message 'type' is not a string");
            type = j["type"].asString();
        }

        if (type == kLatencyType)
            return LatencyMessage{std::move(j)};

        if (type.empty() || type == kFinalType)
        {
            if (!j.isMember("UUID") || !j["UUID"].isString())
                throw MessageFormatError("final echo message has no UUID");
            std::string uuid = j["UUID"].asString();
            if (!is_valid_uuid(uuid))
                throw MessageFormatError("final echo message has an invalid UUID");
            return FinalMessage{uuid, std::move(j)};
        }

        throw MessageFormatError("unknown echo message type '" + type + "'");
    }
} // namespace zt
