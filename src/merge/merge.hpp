#ifndef MERGE_HPP
#define MERGE_HPP

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace merge
{
    /**
     * @brief Three-way merge of JSON documents, one field per line.
     *
     * Each document is pretty-printed with sorted keys so that edits to
     * different fields land on different lines. Edits to neighbouring
     * lines still count as a conflict.
     *
     * @return the merged document, or nullopt on conflict or if the merged
     *         text is not valid JSON.
     */
    std::optional<json> mergePayloads(const json &base, const json &local, const json &remote);
} // namespace merge

#endif // MERGE_HPP
