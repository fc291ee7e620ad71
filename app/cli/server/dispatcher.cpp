#include "dispatcher.hpp"

#include "utils/logger.hpp"

namespace {
using json = nlohmann::json;

template <typename T>
T param(const json &params, const char *name, const T &defaultValue)
{
    if (!params.contains(name) || params[name].is_null()) {
        return defaultValue;
    }
    return params[name].get<T>();
}

// exclude передается строкой символов или массивом односимвольных строк
std::set<char> excludeParam(const json &params, const std::set<char> &defaultValue)
{
    if (!params.contains("exclude") || params["exclude"].is_null()) {
        return defaultValue;
    }

    std::set<char> exclude;
    const auto &value = params["exclude"];
    if (value.is_string()) {
        for (const auto symbol : value.get<std::string>()) {
            exclude.insert(symbol);
        }
        return exclude;
    }
    for (const auto &item : value) {
        for (const auto symbol : item.get<std::string>()) {
            exclude.insert(symbol);
        }
    }
    return exclude;
}

minter::CodeOptions codeOptions(const json &params)
{
    minter::CodeOptions options;
    options.length = param(params, "length", options.length);
    options.segments = param(params, "segments", options.segments);
    options.separator = param(params, "separator", options.separator);
    options.uppercase = param(params, "uppercase", options.uppercase);
    options.numbers = param(params, "numbers", options.numbers);
    options.exclude = excludeParam(params, options.exclude);
    options.prefix = param(params, "prefix", options.prefix);
    options.suffix = param(params, "suffix", options.suffix);
    return options;
}
} // namespace

namespace minter::server {
Response dispatchRequest(Generator &generator, const Request &request)
{
    Response response;
    response.requestId = request.requestId;
    response.success = true;

    const auto &params = request.params;
    try {
        switch (request.command) {
        case CommandType::CODE: {
            response.result = generator.code(codeOptions(params));
            break;
        }
        case CommandType::STRING: {
            response.result = generator.string(param(params, "length", 16),
                                               param<std::string>(params, "charset", "alnum"),
                                               param(params, "secure", true));
            break;
        }
        case CommandType::TOKEN: {
            const auto format = parseTokenFormat(param<std::string>(params, "format", "alnum"));
            response.result = generator.token(param(params, "length", 32),
                                              param<std::string>(params, "action", ""), format);
            break;
        }
        case CommandType::MAGIC_TOKEN: {
            const auto record = generator.magicToken(param<long long>(params, "expires_in", 86400),
                                                     param<std::string>(params, "context", ""),
                                                     param(params, "length", 32));
            response.result = tokenRecordToJson(record);
            break;
        }
        case CommandType::UUID: {
            response.result = generator.uuid();
            break;
        }
        case CommandType::KEY: {
            response.result = generator.key(param<std::string>(params, "prefix", "id"),
                                            param(params, "length", 9));
            break;
        }
        case CommandType::SHORT_ID: {
            response.result = generator.shortId(param(params, "length", 7));
            break;
        }
        case CommandType::SEQUENTIAL_ID: {
            response.result = generator.sequentialId(
                param<std::string>(params, "prefix", ""), param(params, "padding", 8),
                param<std::string>(params, "context", "default"),
                param<int64_t>(params, "start", SequenceCounter::DEFAULT_START));
            break;
        }
        case CommandType::SLUG: {
            if (!params.contains("title")) {
                response.success = false;
                response.error = "Missing title for SLUG";
                break;
            }
            response.result = generator.slug(params["title"].get<std::string>(),
                                             param<std::string>(params, "context", "post"),
                                             param<std::string>(params, "type", "post"));
            break;
        }
        case CommandType::PING: {
            response.result = "pong";
            break;
        }
        case CommandType::UNKNOWN:
        default: {
            response.success = false;
            response.error = "Unknown command";
            break;
        }
        }
    }
    catch (const std::exception &e) {
        response.success = false;
        response.result = nullptr;
        response.error = e.what();
        LOG_ERROR << "Исключение при обработке запроса " << request.requestId << ": " << e.what();
    }

    return response;
}
} // namespace minter::server
