//
// Structured merge of regenerated files
//
// Used by the merge conflict policy. Only document kinds with a well defined
// key structure are merged; everything else is overwritten.
//
//   YAML (.yaml, .yml)   recursive mapping merge, new scalar wins, existing
//                        keys the new document does not mention are kept
//   dotenv (.env*)       KEY=value lines, existing order kept, new keys
//                        appended, new value wins
//

#pragma once

#include <filesystem>
#include <string>

namespace quickform::output {

enum class merge_kind {
    none,
    yaml,
    dotenv
};

/// Merge strategy for an output path (by file name)
merge_kind merge_kind_for(const std::filesystem::path& path);

std::string merge_yaml(const std::string& existing, const std::string& incoming);

std::string merge_dotenv(const std::string& existing, const std::string& incoming);

/// Merge by path kind; for merge_kind::none the incoming text is returned
std::string merge_documents(const std::filesystem::path& path,
                            const std::string& existing,
                            const std::string& incoming);

} // namespace quickform::output
