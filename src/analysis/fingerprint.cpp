#include <pmat/analysis/fingerprint.hpp>
#include <pmat/json.hpp>
#include <pmat/sha256.hpp>

#include <algorithm>

namespace fs = std::filesystem;

namespace pmat::analysis {

static const char* FINGERPRINT_VERSION = "pmat-analysis-v1";

fs::path AnalysisJob::abs(const std::string& rel) const {
    if (root.empty()) return fs::path(rel);
    fs::path r(root);
    // A single-file root is addressed by its own name
    std::error_code ec;
    if (fs::is_regular_file(r, ec)) return r;
    return r / rel;
}

bool is_presentation_option(const std::string& key) {
    return key == "format" || key == "output" || key == "top_files" || key == "limit";
}

Json::Value semantic_options(const Json::Value& options) {
    Json::Value out(Json::objectValue);
    if (!options.isObject()) return out;
    for (const auto& key : options.getMemberNames()) {
        if (is_presentation_option(key) || options[key].isNull()) continue;
        out[key] = options[key];
    }
    return out;
}

std::string compute_fingerprint(AnalysisKind kind,
                                std::vector<std::pair<std::string, std::string>> files,
                                const Json::Value& options,
                                const std::vector<std::string>& salt) {
    std::sort(files.begin(), files.end());

    SHA256 h;
    h.update_field(FINGERPRINT_VERSION);
    h.update_field(kind_name(kind));
    h.update_field(std::to_string(files.size()));
    for (const auto& f : files) {
        h.update_field(f.first);
        h.update_field(f.second);
    }
    h.update_field(json::compact(semantic_options(options)));
    for (const auto& s : salt) h.update_field(s);
    return SHA256::hex(h.finalize());
}

void refresh_fingerprint(AnalysisJob& job) {
    std::vector<std::pair<std::string, std::string>> pairs;
    pairs.reserve(job.files.size());
    for (size_t i = 0; i < job.files.size(); ++i) {
        pairs.emplace_back(job.files[i], i < job.hashes.size() ? job.hashes[i] : "");
    }
    job.fingerprint = compute_fingerprint(job.kind, std::move(pairs), job.options, job.salt);
}

Result<AnalysisJob> make_job(AnalysisKind kind, const std::string& root,
                             std::vector<std::string> files, const Json::Value& options) {
    std::sort(files.begin(), files.end());
    files.erase(std::unique(files.begin(), files.end()), files.end());

    AnalysisJob job;
    job.kind = kind;
    job.root = root;
    job.options = semantic_options(options);
    job.hashes.reserve(files.size());
    for (const auto& f : files) {
        auto hash = SHA256::hash_file(job.abs(f));
        if (hash.is_err()) {
            return PmatError(PmatError::IO, "cannot fingerprint input " + f)
                .with_cause(hash.error());
        }
        job.hashes.push_back(std::move(hash).value());
    }
    job.files = std::move(files);
    refresh_fingerprint(job);
    return Result<AnalysisJob>::ok(std::move(job));
}

} // namespace pmat::analysis
