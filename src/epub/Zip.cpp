#include "epub/Zip.hpp"

#include <stdexcept>
#include <fmt/format.h>

using namespace ib::epub;

namespace {

std::string zipErrorString(const int code) {
    zip_error_t err;
    zip_error_init_with_code(&err, code);
    std::string msg = zip_error_strerror(&err);
    zip_error_fini(&err);
    return msg;
}

}

// ---------------- ZipReader ----------------

ZipReader::ZipReader(const std::filesystem::path& path) : path_(path) {
    int code = 0;
    archive_ = zip_open(path.c_str(), ZIP_RDONLY, &code);
    if (!archive_)
        throw std::runtime_error(fmt::format("Cannot open archive {}: {}", path.string(), zipErrorString(code)));
}

ZipReader::~ZipReader() {
    if (archive_) zip_discard(archive_);
}

std::vector<ZipEntryInfo> ZipReader::entries() const {
    const zip_int64_t n = zip_get_num_entries(archive_, 0);
    std::vector<ZipEntryInfo> out;
    out.reserve(n > 0 ? static_cast<size_t>(n) : 0);

    for (zip_int64_t i = 0; i < n; ++i) {
        const char* raw = zip_get_name(archive_, static_cast<zip_uint64_t>(i), 0);
        if (!raw) throw std::runtime_error(fmt::format("Cannot read entry {} of {}: {}", i, path_.string(),
                                                       zip_strerror(archive_)));
        std::string name(raw);
        const bool dir = !name.empty() && name.back() == '/';
        out.push_back({std::move(name), dir});
    }
    return out;
}

bool ZipReader::has(const std::string& name) const {
    return zip_name_locate(archive_, name.c_str(), 0) >= 0;
}

std::string ZipReader::read(const std::string& name) const {
    const zip_int64_t idx = zip_name_locate(archive_, name.c_str(), 0);
    if (idx < 0) throw std::runtime_error(fmt::format("No entry '{}' in {}", name, path_.string()));
    return readIndex(static_cast<zip_uint64_t>(idx), name);
}

std::string ZipReader::readIndex(const zip_uint64_t index, const std::string& name) const {
    zip_stat_t st;
    zip_stat_init(&st);
    if (zip_stat_index(archive_, index, 0, &st) != 0)
        throw std::runtime_error(fmt::format("Cannot stat '{}' in {}: {}", name, path_.string(), zip_strerror(archive_)));

    zip_file_t* file = zip_fopen_index(archive_, index, 0);
    if (!file)
        throw std::runtime_error(fmt::format("Cannot open '{}' in {}: {}", name, path_.string(), zip_strerror(archive_)));

    std::string data(static_cast<size_t>(st.size), '\0');
    const zip_int64_t n = st.size ? zip_fread(file, data.data(), st.size) : 0;
    const std::string fileErr = n < 0 ? zip_file_strerror(file) : "";
    zip_fclose(file);

    if (n < 0 || static_cast<zip_uint64_t>(n) != st.size)
        throw std::runtime_error(fmt::format("Short read of '{}' in {} ({} of {} bytes){}", name, path_.string(),
                                             n, st.size, fileErr.empty() ? "" : ": " + fileErr));
    return data;
}

// ---------------- ZipWriter ----------------

ZipWriter::ZipWriter(const std::filesystem::path& path) : path_(path) {
    int code = 0;
    archive_ = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &code);
    if (!archive_)
        throw std::runtime_error(fmt::format("Cannot create archive {}: {}", path.string(), zipErrorString(code)));
}

ZipWriter::~ZipWriter() {
    if (archive_) zip_discard(archive_);
}

void ZipWriter::fail(const std::string& what) const {
    throw std::runtime_error(fmt::format("{} in {}: {}", what, path_.string(), zip_strerror(archive_)));
}

void ZipWriter::add(const std::string& name, std::string data, const Compression compression) {
    if (!archive_) throw std::logic_error("ZipWriter used after close()");

    // libzip reads the buffer lazily at zip_close(), keep it alive until then
    const auto& buf = buffers_.emplace_back(std::move(data));

    zip_source_t* src = zip_source_buffer(archive_, buf.data(), buf.size(), 0);
    if (!src) fail(fmt::format("Cannot create source for '{}'", name));

    const zip_int64_t idx = zip_file_add(archive_, name.c_str(), src, ZIP_FL_ENC_UTF_8);
    if (idx < 0) {
        zip_source_free(src);
        fail(fmt::format("Cannot add '{}'", name));
    }

    const auto index = static_cast<zip_uint64_t>(idx);
    const zip_int32_t method = compression == Compression::Store ? ZIP_CM_STORE : ZIP_CM_DEFLATE;
    if (zip_set_file_compression(archive_, index, method, 0) != 0)
        fail(fmt::format("Cannot set compression for '{}'", name));

    if (zip_file_extra_fields_delete(archive_, index, ZIP_EXTRA_FIELD_ALL, ZIP_FL_LOCAL | ZIP_FL_CENTRAL) != 0)
        fail(fmt::format("Cannot strip extra fields of '{}'", name));
}

void ZipWriter::addDirectory(const std::string& name) {
    if (!archive_) throw std::logic_error("ZipWriter used after close()");

    std::string dir = name;
    if (!dir.empty() && dir.back() == '/') dir.pop_back();
    if (zip_dir_add(archive_, dir.c_str(), ZIP_FL_ENC_UTF_8) < 0)
        fail(fmt::format("Cannot add directory '{}'", name));
}

void ZipWriter::close() {
    if (!archive_) return;
    if (zip_close(archive_) != 0) {
        const std::string err = zip_strerror(archive_);
        zip_discard(archive_);
        archive_ = nullptr;
        throw std::runtime_error(fmt::format("Cannot write archive {}: {}", path_.string(), err));
    }
    archive_ = nullptr;
    buffers_.clear();
}
