#pragma once

// The jsonpatch command-line tool, as a library so tests can drive it.
//
// Internal header — not installed.

#include <jsonpatch-cpp/batch.hpp>

#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace jsonpatch_cpp::cli {

/// Usage text printed for -help and for a missing patch argument.
extern const std::string_view usage;

/// Documents on disk. Selectors are glob(3) patterns; JSON or YAML is
/// chosen by file extension.
class FileSource final : public DocumentSource {
public:
    auto match(const std::string& selector) const -> std::vector<std::string> override;
    auto load(const std::string& id) const -> Value override;
};

/// Read a whole file.
/// @throws PatchError(io_error) naming the file.
auto read_file(const std::string& path) -> std::string;

/// Read a JSON or YAML file (by extension) into a Value.
auto read_document(const std::string& path) -> Value;

/// Write every document to `<outdir>/<id>`, as YAML for .yaml/.yml ids
/// and as JSON with `indent` otherwise. Each file is first written beside
/// its target and renamed into place once all of them are written, so a
/// failed write leaves every target untouched.
/// @throws PatchError(io_error) naming the file.
void write_documents(const std::vector<PatchedDocument>& documents,
                     const std::string& outdir, int indent);

/// Run the tool. `args` excludes the program name. Diagnostics and usage go
/// to `out`.
/// @return 0 on success, 1 on failure, 2 for usage errors and -help.
auto testable_main(const std::vector<std::string>& args, std::ostream& out) -> int;

}  // namespace jsonpatch_cpp::cli
