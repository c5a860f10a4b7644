#ifndef ARBOR_REQUEST_DATA_HPP
#define ARBOR_REQUEST_DATA_HPP

#include "common.hpp"
#include "submatches.hpp"

// Per-request render context that can receive the captures of the resolved path
class RequestData
{
public:
    virtual ~RequestData() = default;

    virtual void setPathExpressionSubmatches(const PathSubmatches &submatches) = 0;

    // value templates are executed against
    [[nodiscard]] virtual json toJson() const = 0;
};

// JSON object context. Receives the whole capture list under
// "pathExpressionSubmatches" and every named capture under its own key.
class RequestDataMap : public RequestData
{
public:
    static constexpr const char *SUBMATCHES_KEY = "pathExpressionSubmatches";

    RequestDataMap() : values(json::object()) {}
    explicit RequestDataMap(json initial);

    void set(const std::string &key, json value);

    void setPathExpressionSubmatches(const PathSubmatches &submatches) override;
    [[nodiscard]] json toJson() const override { return values; }

private:
    json values;
};

// Keeps only the named captures; derive from it to add request fields
class PathExpressionSubmatches : public RequestData
{
public:
    void setPathExpressionSubmatches(const PathSubmatches &submatches) override;
    [[nodiscard]] json toJson() const override;

    // empty when no capture has that name
    [[nodiscard]] std::string get(const std::string &key) const;
    [[nodiscard]] const std::map<std::string, std::string> &submatches() const noexcept { return named; }

private:
    std::map<std::string, std::string> named;
};

class RequestDataBinder
{
public:
    // render context for a resolved request; null when the caller supplies no data
    [[nodiscard]] static json bind(RequestData *data, const PathSubmatches &submatches);
};

#endif // ARBOR_REQUEST_DATA_HPP
