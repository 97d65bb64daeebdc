#include "merge.hpp"
#include <git2.h>
#include "../logger/Mylogger.hpp"

namespace merge
{
    namespace
    {
        // libgit2 is reference counted, one init per merge is enough.
        struct GitSession
        {
            GitSession() { git_libgit2_init(); }
            ~GitSession() { git_libgit2_shutdown(); }
        };

        struct MergedFile
        {
            git_merge_file_result result{};
            ~MergedFile() { git_merge_file_result_free(&result); }
        };

        git_merge_file_input textInput(const std::string &text)
        {
            git_merge_file_input input = GIT_MERGE_FILE_INPUT_INIT;
            input.ptr = text.data();
            input.size = text.size();
            input.mode = 0100644;
            return input;
        }

        std::string asText(const json &doc)
        {
            return doc.dump(2) + "\n";
        }
    } // namespace

    std::optional<json> mergePayloads(const json &base, const json &local, const json &remote)
    {
        if (local == remote)
            return local;
        if (base == local)
            return remote;
        if (base == remote)
            return local;

        const std::string baseText = asText(base);
        const std::string localText = asText(local);
        const std::string remoteText = asText(remote);
        git_merge_file_input ancestor = textInput(baseText);
        git_merge_file_input ours = textInput(localText);
        git_merge_file_input theirs = textInput(remoteText);

        // Indentation is structural in pretty JSON, so whitespace is not ignored.
        git_merge_file_options opts = GIT_MERGE_FILE_OPTIONS_INIT;
        opts.flags = GIT_MERGE_FILE_DIFF_PATIENCE | GIT_MERGE_FILE_DIFF_MINIMAL;

        GitSession session;
        MergedFile merged;
        int rc = git_merge_file(&merged.result, &ancestor, &ours, &theirs, &opts);
        if (rc != 0 || merged.result.ptr == nullptr)
        {
            const git_error *err = git_error_last();
            MyLogger::warning("Merge >> git_merge_file failed (" + std::to_string(rc) + "): " +
                              (err && err->message ? err->message : "unknown error"));
            return std::nullopt;
        }
        if (!merged.result.automergeable)
        {
            MyLogger::info("Merge >> payloads conflict line by line");
            return std::nullopt;
        }

        try
        {
            return json::parse(merged.result.ptr, merged.result.ptr + merged.result.len);
        }
        catch (const json::parse_error &e)
        {
            MyLogger::warning(std::string("Merge >> Merged text is not JSON: ") + e.what());
            return std::nullopt;
        }
    }
} // namespace merge
