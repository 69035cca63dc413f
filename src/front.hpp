#pragma once

#include <cstdint>
#include <cstdio>

#include <etl/span.h>
#include <etl/string_view.h>
#include <etl/vector.h>

#include "utils/utils.hpp"
#include "logging/logging.hpp"

#include "param.hpp"

// Base class for polymorphism
class IFrontend {
public:
    virtual ~IFrontend() = default;
    virtual void Init() = 0;
    virtual etl::span<const ParamDef> GetParamLayout() const = 0;
    virtual const etl::string_view GetParamGroup() const = 0;
    virtual ErrorParam SetParam(const char* name, const void* data, uint32_t len) = 0;
    virtual ErrorParam GetParam(const char* name, char* value, uint32_t& len, ParamType& type) = 0;
    virtual ErrorParam LoadParams() = 0;
    virtual ErrorParam SaveParams() = 0;
};


namespace Front {
    constexpr uint32_t MAX_FRONTENDS = 10;
    constexpr uint32_t MAX_PATH_LEN = 256;

    etl::vector<IFrontend*, MAX_FRONTENDS>& Get();

    void AddFrontend(IFrontend* frontend);
    void RemoveFrontend(IFrontend* frontend);
    void InitFrontends();

    ErrorParam WriteGlobalParam(const char* group, const char* name, const void* data, uint32_t len);
    ErrorParam ReadGlobalParam(const char* group, const char* name, char* value, uint32_t& len, ParamType& type);

    /**
     * @brief Apply a "group.name=value" assignment (command line -p)
     */
    ErrorParam ApplyAssignment(etl::string_view assignment);

    /**
     * @brief Write "group.name: value" for every registered parameter
     *
     * The output is a valid parameter file.
     *
     * @return First read error, the remaining parameters are still written
     */
    ErrorParam PrintAllParams(FILE* out);

    // Every group rewrites its own lines of the parameter file
    ErrorParam SaveAllParams();

    // Text file every file backed frontend reads from and writes to
    void SetParamsPath(const char* path);
    const char* GetParamsPath();
}
