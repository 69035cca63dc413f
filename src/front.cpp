#include "front.hpp"

#include <algorithm>
#include <cstring>

#include <etl/string.h>

static char s_ParamsPath[Front::MAX_PATH_LEN] = "params.txt";

void Front::AddFrontend(IFrontend* frontend)
{
    if (Get().full()) {
        LOG_ERROR("Frontend registry full, group '%.*s' not registered",
                  static_cast<int>(frontend->GetParamGroup().size()), frontend->GetParamGroup().data());
        return;
    }
    Get().push_back(frontend);
}

void Front::RemoveFrontend(IFrontend* frontend)
{
    etl::vector<IFrontend*, Front::MAX_FRONTENDS>& frontends = Get();
    frontends.erase(std::remove(frontends.begin(), frontends.end(), frontend), frontends.end());
}

void Front::InitFrontends()
{
    LOG_DEBUG("------ Initializing the frontends ------");
    etl::vector<IFrontend*, Front::MAX_FRONTENDS>& frontends = Get();
    for (size_t i = 0; i < frontends.size(); i++)
    {
        IFrontend* frontend = frontends[i];
        frontend->Init();
    }
    LOG_DEBUG("------ Frontends initialized ------");
}

ErrorParam Front::WriteGlobalParam(const char *group, const char *name, const void *data, uint32_t len)
{
    etl::vector<IFrontend*, Front::MAX_FRONTENDS>& frontends = Get();
    for (size_t i = 0; i < frontends.size(); i++)
    {
        IFrontend* frontend = frontends[i];
        if (frontend->GetParamGroup() == etl::string_view(group))
        {
            return frontend->SetParam(name, data, len);
        }
    }
    return ErrorParam::GROUP_NOT_FOUND;
}

ErrorParam Front::ReadGlobalParam(const char *group, const char *name, char* value, uint32_t &len, ParamType &type)
{
    etl::vector<IFrontend*, Front::MAX_FRONTENDS>& frontends = Get();
    for (size_t i = 0; i < frontends.size(); i++)
    {
        IFrontend* frontend = frontends[i];
        if (frontend->GetParamGroup() == etl::string_view(group))
        {
            return frontend->GetParam(name, value, len, type);
        }
    }
    return ErrorParam::GROUP_NOT_FOUND;
}

ErrorParam Front::ApplyAssignment(etl::string_view assignment)
{
    etl::string_view group;
    etl::string_view name;
    etl::string_view value;
    if (!Utils::SplitParamAssignment(assignment, '=', group, name, value)) {
        return ErrorParam::INVALID_DATA;
    }

    etl::string<64> groupStr;
    etl::string<64> nameStr;
    etl::string<128> valueStr;
    if (group.size() > groupStr.capacity() || name.size() > nameStr.capacity()) {
        return ErrorParam::NAME_NOT_FOUND;
    }
    if (value.size() > valueStr.capacity()) {
        return ErrorParam::PARAM_TOO_LONG;
    }
    groupStr.assign(group.begin(), group.end());
    nameStr.assign(name.begin(), name.end());
    valueStr.assign(value.begin(), value.end());

    return WriteGlobalParam(groupStr.c_str(), nameStr.c_str(), valueStr.c_str(), static_cast<uint32_t>(valueStr.size()));
}

ErrorParam Front::PrintAllParams(FILE* out)
{
    ErrorParam result = ErrorParam::OK;

    for (IFrontend* frontend : Get()) {
        const etl::string_view group = frontend->GetParamGroup();
        etl::string<64> groupStr(group.begin(), group.end());

        for (const ParamDef& param : frontend->GetParamLayout()) {
            char value[128] = {};
            uint32_t len = 0;
            ParamType type = ParamType::UNDEFINED;
            ErrorParam err = ReadGlobalParam(groupStr.c_str(), param.name, value, len, type);
            if (err != ErrorParam::OK) {
                LOG_WARN("Cannot read %s.%s: %s", groupStr.c_str(), param.name, ToString(err));
                if (result == ErrorParam::OK) {
                    result = err;
                }
                continue;
            }
            fprintf(out, "%s.%s: %.*s\n", groupStr.c_str(), param.name, static_cast<int>(len), value);
        }
    }

    if (fflush(out) != 0) {
        return ErrorParam::FAILED_TO_WRITE;
    }
    return result;
}

ErrorParam Front::SaveAllParams()
{
    etl::vector<IFrontend*, Front::MAX_FRONTENDS>& frontends = Get();
    ErrorParam result = ErrorParam::OK;

    for (size_t i = 0; i < frontends.size(); i++)
    {
        IFrontend* frontend = frontends[i];
        ErrorParam saveResult = frontend->SaveParams();
        if (saveResult != ErrorParam::OK) {
            result = saveResult;
        }
    }
    return result;
}

void Front::SetParamsPath(const char* path)
{
    strncpy(s_ParamsPath, path, sizeof(s_ParamsPath) - 1);
    s_ParamsPath[sizeof(s_ParamsPath) - 1] = '\0';
}

const char* Front::GetParamsPath()
{
    return s_ParamsPath;
}

etl::vector<IFrontend*, Front::MAX_FRONTENDS>& Front::Get() {
    static etl::vector<IFrontend*, Front::MAX_FRONTENDS> frontends;
    return frontends;
}

const char* ToString(ErrorParam error)
{
    switch (error) {
        case ErrorParam::OK:                return "OK";
        case ErrorParam::NAME_NOT_FOUND:    return "NAME_NOT_FOUND";
        case ErrorParam::GROUP_NOT_FOUND:   return "GROUP_NOT_FOUND";
        case ErrorParam::FAILED_TO_WRITE:   return "FAILED_TO_WRITE";
        case ErrorParam::FAILED_TO_READ:    return "FAILED_TO_READ";
        case ErrorParam::PARAM_TOO_LONG:    return "PARAM_TOO_LONG";
        case ErrorParam::INVALID_DATA:      return "INVALID_DATA";
        case ErrorParam::FILE_SYSTEM_ERROR: return "FILE_SYSTEM_ERROR";
        case ErrorParam::FILE_NOT_FOUND:    return "FILE_NOT_FOUND";
        default:                            return "UNKNOWN";
    }
}
