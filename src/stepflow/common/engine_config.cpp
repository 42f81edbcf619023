/**
 * @file engine_config.cpp
 */
#include "stepflow/common/engine_config.hpp"
#include "stepflow/common/errors.hpp"

#include <fstream>

namespace stepflow
{

namespace
{

StepflowError invalid(const std::string& message)
{
    return StepflowError(ErrorCode::InvalidInput, "Invalid engine config: " + message);
}

size_t read_count(const Value& json, const char* key, size_t fallback)
{
    auto it = json.find(key);
    if (it == json.end())
    {
        return fallback;
    }
    if (!it->is_number_unsigned())
    {
        throw invalid(std::string("'") + key + "' must be a non-negative integer");
    }
    return it->get<size_t>();
}

} // namespace

EngineConfig engine_config_from_json(const Value& json)
{
    if (!json.is_object())
    {
        throw invalid("expected a JSON object");
    }

    EngineConfig config;
    config.executor.thread_count = read_count(json, "maxConcurrency", config.executor.thread_count);
    config.max_supersteps = read_count(json, "maxSupersteps", config.max_supersteps);
    if (config.max_supersteps == 0)
    {
        throw invalid("'maxSupersteps' must be at least 1");
    }

    if (auto it = json.find("collectTiming"); it != json.end())
    {
        if (!it->is_boolean())
        {
            throw invalid("'collectTiming' must be a boolean");
        }
        config.executor.collect_timing = it->get<bool>();
    }

    if (auto it = json.find("logLevel"); it != json.end())
    {
        if (!it->is_string())
        {
            throw invalid("'logLevel' must be a string");
        }
        auto level = spdlog::level::from_str(it->get<std::string>());
        // from_str() maps unrecognized names to "off"
        if (level == spdlog::level::off && it->get<std::string>() != "off")
        {
            throw invalid("unknown log level '" + it->get<std::string>() + "'");
        }
        config.log_level = level;
    }

    if (auto it = json.find("checkpoint"); it != json.end())
    {
        if (!it->is_object())
        {
            throw invalid("'checkpoint' must be an object");
        }
        const Value& checkpoint = *it;
        std::string type = "memory";
        if (auto t = checkpoint.find("type"); t != checkpoint.end())
        {
            if (!t->is_string())
            {
                throw invalid("'checkpoint.type' must be a string");
            }
            type = t->get<std::string>();
        }
        if (type == "memory")
        {
            config.checkpoint.backend = CheckpointBackend::Memory;
        }
        else if (type == "file")
        {
            config.checkpoint.backend = CheckpointBackend::File;
            auto dir = checkpoint.find("directory");
            if (dir == checkpoint.end() || !dir->is_string() || dir->get<std::string>().empty())
            {
                throw invalid("file checkpoints require a 'directory'");
            }
            config.checkpoint.directory = dir->get<std::string>();
        }
        else
        {
            throw invalid("unknown checkpoint type '" + type + "'");
        }
    }

    return config;
}

EngineConfig load_engine_config(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
    {
        throw StepflowError(ErrorCode::InvalidInput, "Cannot open engine config: " + path);
    }
    Value json = Value::parse(in, nullptr, /*allow_exceptions=*/false);
    if (json.is_discarded())
    {
        throw StepflowError(ErrorCode::InvalidInput, "Malformed JSON in engine config: " + path);
    }
    return engine_config_from_json(json);
}

} // namespace stepflow
