#include "app.hpp"

#include <jsonpatch-cpp/error.hpp>
#include <jsonpatch-cpp/json.hpp>
#include <jsonpatch-cpp/yaml.hpp>

#include <glob.h>

#include <charconv>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>
#include <system_error>
#include <utility>

namespace jsonpatch_cpp::cli {

const std::string_view usage =
R"(usage: jsonpatch [-outdir <dir>] [-indent <n>] <patch file> [<documents>]

jsonpatch applies RFC 6902 JSON Patches to JSON or YAML documents.

If at least one document is provided, the patch file is parsed as a RFC 6902 JSON Patch.

If no documents are provided, the patch file is parsed as a batch patch file:

[
	{
		"glob": "*.json",
		"jsonPatch": [
			{ "op": "add", "path": "/a", "value": 1 }
		]
	},
	{
		"glob": "*.yaml",
		"jsonPatch": [
			{ "op": "test", "path": "/b", "value": 1 },
			{ "op": "remove", "path": "/b" }
		]
	}
]

Patched documents are written to <outdir>/<document path>. Nothing is
written unless every document patches cleanly.

flags:
  -outdir <dir>   the directory where patched documents are emitted (default ".")
  -indent <n>     spaces per level in JSON output (default 2)
)";

// =============================================================================
// Files
// =============================================================================

auto read_file(const std::string& path) -> std::string {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) {
        throw PatchError{ErrorKind::io_error, "cannot open " + path};
    }
    auto buffer = std::ostringstream{};
    buffer << in.rdbuf();
    if (in.bad()) {
        throw PatchError{ErrorKind::io_error, "cannot read " + path};
    }
    return buffer.str();
}

auto read_document(const std::string& path) -> Value {
    auto text = read_file(path);
    try {
        return is_yaml_path(path) ? decode_yaml(text) : decode(text);
    } catch (const PatchError& e) {
        throw PatchError{e.kind(), path + ": " + e.what()};
    }
}

auto FileSource::match(const std::string& selector) const -> std::vector<std::string> {
    auto matches = glob_t{};
    auto rc = ::glob(selector.c_str(), 0, nullptr, &matches);
    auto guard = std::unique_ptr<glob_t, decltype(&::globfree)>{&matches, &::globfree};
    if (rc == GLOB_NOMATCH) return {};
    if (rc != 0) {
        throw PatchError{ErrorKind::io_error, "cannot expand glob \"" + selector + "\""};
    }
    auto ids = std::vector<std::string>{};
    ids.reserve(matches.gl_pathc);
    for (std::size_t i = 0; i < matches.gl_pathc; ++i) {
        ids.emplace_back(matches.gl_pathv[i]);
    }
    return ids;
}

auto FileSource::load(const std::string& id) const -> Value {
    return read_document(id);
}

namespace {

namespace fs = std::filesystem;

/// Files staged beside their targets. Whatever has not been committed is
/// removed on destruction.
class StagedFiles {
public:
    StagedFiles() = default;
    StagedFiles(const StagedFiles&) = delete;
    auto operator=(const StagedFiles&) -> StagedFiles& = delete;

    ~StagedFiles() {
        for (std::size_t i = committed_; i < staged_.size(); ++i) {
            auto ec = std::error_code{};
            fs::remove(staged_[i].first, ec);
        }
    }

    void stage(const fs::path& target, const std::string& text) {
        if (target.has_parent_path()) {
            auto ec = std::error_code{};
            fs::create_directories(target.parent_path(), ec);
            if (ec) {
                throw PatchError{ErrorKind::io_error, "cannot create directory " +
                                 target.parent_path().string() + ": " + ec.message()};
            }
        }
        auto temp = target;
        temp += ".jsonpatch-tmp";
        staged_.emplace_back(temp, target);
        auto out = std::ofstream{temp, std::ios::binary | std::ios::trunc};
        out << text;
        out.close();
        if (!out) {
            throw PatchError{ErrorKind::io_error, "cannot write " + target.string()};
        }
    }

    void commit() {
        for (; committed_ < staged_.size(); ++committed_) {
            const auto& [temp, target] = staged_[committed_];
            auto ec = std::error_code{};
            fs::rename(temp, target, ec);
            if (ec) {
                throw PatchError{ErrorKind::io_error,
                                 "cannot write " + target.string() + ": " + ec.message()};
            }
        }
    }

private:
    std::vector<std::pair<fs::path, fs::path>> staged_;
    std::size_t committed_ = 0;
};

}  // anonymous namespace

void write_documents(const std::vector<PatchedDocument>& documents,
                     const std::string& outdir, int indent) {
    auto files = StagedFiles{};
    for (const auto& doc : documents) {
        const auto target = fs::path{outdir} / fs::path{doc.id}.relative_path();
        files.stage(target, is_yaml_path(doc.id) ? encode_yaml(doc.value)
                                                 : encode(doc.value, indent) + "\n");
    }
    files.commit();
}

// =============================================================================
// Command line
// =============================================================================

namespace {

struct Options {
    std::string outdir = ".";
    int indent = 2;
    std::vector<std::string> positional;
};

enum class ParseResult : std::uint8_t { ok, help, error };

auto parse_int(std::string_view text) -> std::optional<int> {
    auto value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) return std::nullopt;
    return value;
}

// Go-style flags: -name value, -name=value, --name; flags end at the
// first positional argument or "--".
auto parse_args(const std::vector<std::string>& args, Options& opts, std::ostream& out)
    -> ParseResult {
    auto i = std::size_t{0};
    for (; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "--") {
            ++i;
            break;
        }
        if (arg.size() < 2 || arg[0] != '-') break;

        auto name = std::string_view{arg}.substr(arg[1] == '-' ? 2 : 1);
        auto value = std::optional<std::string>{};
        if (auto eq = name.find('='); eq != std::string_view::npos) {
            value = std::string{name.substr(eq + 1)};
            name = name.substr(0, eq);
        }

        if (name == "h" || name == "help") return ParseResult::help;

        if (name != "outdir" && name != "indent") {
            out << "flag provided but not defined: -" << name << '\n' << usage;
            return ParseResult::error;
        }
        if (!value) {
            if (i + 1 >= args.size()) {
                out << "flag needs an argument: -" << name << '\n' << usage;
                return ParseResult::error;
            }
            value = args[++i];
        }
        if (name == "outdir") {
            opts.outdir = *value;
        } else {
            auto indent = parse_int(*value);
            if (!indent || *indent < 0) {
                out << "invalid value \"" << *value << "\" for flag -indent\n" << usage;
                return ParseResult::error;
            }
            opts.indent = *indent;
        }
    }
    opts.positional.assign(args.begin() + static_cast<std::ptrdiff_t>(i), args.end());
    return ParseResult::ok;
}

auto is_load_failure(const Error& e) -> bool {
    return e.kind == ErrorKind::io_error || e.kind == ErrorKind::malformed_document;
}

auto describe(const BatchError& e, const Patch& patch) -> std::string {
    if (is_load_failure(e.cause())) return e.cause().message;
    return "error applying JSON Patch " + encode_patch(patch) + " to " + e.document() +
           ": " + e.cause().message;
}

auto apply_batch_file(const std::string& batch_path, const Options& opts, std::ostream& out)
    -> int {
    auto batch = Batch{};
    try {
        batch = decode_batch(read_document(batch_path));
    } catch (const PatchError& e) {
        if (e.kind() == ErrorKind::io_error) {
            out << e.what() << '\n';
        } else {
            out << "invalid batch file " << batch_path << ": " << e.what() << '\n';
        }
        return 1;
    }

    auto documents = std::vector<PatchedDocument>{};
    try {
        documents = run_batch(batch, FileSource{});
    } catch (const BatchError& e) {
        out << describe(e, batch[e.entry_index()].patch) << '\n';
        return 1;
    }

    write_documents(documents, opts.outdir, opts.indent);
    return 0;
}

auto apply_patch_file(const std::string& patch_path, const std::vector<std::string>& document_paths,
                      const Options& opts, std::ostream& out) -> int {
    auto patch = Patch{};
    try {
        patch = decode_patch(read_document(patch_path));
    } catch (const PatchError& e) {
        if (e.kind() == ErrorKind::io_error) {
            out << e.what() << '\n';
        } else {
            out << "invalid JSON Patch " << patch_path << ": " << e.what() << '\n';
        }
        return 1;
    }

    auto documents = std::vector<PatchedDocument>{};
    try {
        documents = run_patch(patch, document_paths, FileSource{});
    } catch (const BatchError& e) {
        out << describe(e, patch) << '\n';
        return 1;
    }

    write_documents(documents, opts.outdir, opts.indent);
    return 0;
}

}  // anonymous namespace

auto testable_main(const std::vector<std::string>& args, std::ostream& out) -> int {
    auto opts = Options{};
    switch (parse_args(args, opts, out)) {
        case ParseResult::help:
            out << usage;
            return 2;
        case ParseResult::error:
            return 1;
        case ParseResult::ok:
            break;
    }

    if (opts.positional.empty()) {
        out << usage;
        return 2;
    }

    try {
        const auto& patch_path = opts.positional.front();
        if (opts.positional.size() == 1) {
            return apply_batch_file(patch_path, opts, out);
        }
        auto documents = std::vector<std::string>(opts.positional.begin() + 1, opts.positional.end());
        return apply_patch_file(patch_path, documents, opts, out);
    } catch (const PatchError& e) {
        out << e.what() << '\n';
        return 1;
    }
}

}  // namespace jsonpatch_cpp::cli
