#include "engine/ArchiveBundle.hpp"

#include "utils/Json.hpp"
#include "utils/Log.hpp"

#include <yyjson.h>

namespace hm::engine
{

DecodedBundle decode_archive_bundle(std::string_view payload)
{
    DecodedBundle result;
    auto doc = json::Document::parse(payload);
    auto *root = doc.root();
    if (root == nullptr || !yyjson_is_obj(root))
    {
        HM_LOG_ERROR("archive bundle is not a JSON object");
        result.status = FetchStatus::MalformedArchive;
        return result;
    }
    auto *archive = yyjson_obj_get(root, "archive");
    if (archive == nullptr || !yyjson_is_arr(archive))
    {
        HM_LOG_ERROR("archive bundle has no \"archive\" array");
        result.status = FetchStatus::MalformedArchive;
        return result;
    }
    result.documents.reserve(yyjson_arr_size(archive));
    size_t idx, limit;
    yyjson_val *entry = nullptr;
    yyjson_arr_foreach(archive, idx, limit, entry)
    {
        auto path = json::get_string(entry, "path");
        auto content = json::get_string(entry, "json");
        if (!path || !content)
        {
            HM_LOG_ERROR("archive bundle entry {} lacks path or json", idx);
            result.status = FetchStatus::MalformedArchive;
            result.documents.clear();
            return result;
        }
        result.documents.push_back(
            ArchivedJson{std::string(*path), std::string(*content)});
    }
    return result;
}

} // namespace hm::engine
