#include "request_data.hpp"

namespace
{
    // later segments overwrite captures of the same name from earlier ones
    template <typename Sink>
    void forEachNamed(const PathSubmatches &submatches, Sink sink)
    {
        for (const auto &entry : submatches)
        {
            for (const auto &kv : entry.submatches)
            {
                if (!kv.key.empty())
                    sink(kv.key, kv.value);
            }
        }
    }
}

RequestDataMap::RequestDataMap(json initial) : values(std::move(initial))
{
    if (!values.is_object())
    {
        throw std::invalid_argument("RequestDataMap needs a JSON object");
    }
}

void RequestDataMap::set(const std::string &key, json value)
{
    values[key] = std::move(value);
}

void RequestDataMap::setPathExpressionSubmatches(const PathSubmatches &submatches)
{
    values[SUBMATCHES_KEY] = submatches;
    forEachNamed(submatches, [this](const std::string &key, const std::string &value)
                 { values[key] = value; });
}

void PathExpressionSubmatches::setPathExpressionSubmatches(const PathSubmatches &submatches)
{
    forEachNamed(submatches, [this](const std::string &key, const std::string &value)
                 { named[key] = value; });
}

json PathExpressionSubmatches::toJson() const
{
    return json(named);
}

std::string PathExpressionSubmatches::get(const std::string &key) const
{
    auto it = named.find(key);
    return it == named.end() ? std::string() : it->second;
}

json RequestDataBinder::bind(RequestData *data, const PathSubmatches &submatches)
{
    if (!data)
    {
        return nullptr;
    }
    data->setPathExpressionSubmatches(submatches);
    return data->toJson();
}
