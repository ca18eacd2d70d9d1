#include "storage/ContentStore.hpp"
#include "crypto/util/hash.hpp"
#include "log/Registry.hpp"
#include "util/timestamp.hpp"

#include <fstream>
#include <sstream>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <nlohmann/json.hpp>
#include <fmt/format.h>

namespace fs = std::filesystem;

namespace dm::storage {

namespace {

std::string extensionFor(const std::string& originalFilename) {
    auto ext = util::extensionOf(originalFilename);
    return ext.empty() ? "bin" : ext;
}

void removeQuietly(const fs::path& p) {
    std::error_code ec;
    fs::remove(p, ec);
    if (ec) log::Registry::storage()->warn("[ContentStore] Failed to remove temp file {}: {}", p.string(), ec.message());
}

}

ContentStore::ContentStore(fs::path root, util::MimeResolver mime)
    : root_(std::move(root)), mime_(std::move(mime)) {}

fs::path ContentStore::tempPath() const {
    thread_local boost::uuids::random_generator gen;
    return root_ / (".tmp-" + boost::uuids::to_string(gen()));
}

StoredFile ContentStore::put(std::istream& in, const std::string& originalFilename) const {
    std::error_code ec;
    fs::create_directories(root_, ec);
    if (ec) throw WriteError(fmt::format("Failed to create cache root {}: {}", root_.string(), ec.message()));

    const auto tmp = tempPath();
    StoredFile file;
    crypto::hash::Sha256 hasher;

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) throw WriteError("Failed to open temp file for writing: " + tmp.string());

        char buffer[64 * 1024];
        while (in) {
            in.read(buffer, sizeof(buffer));
            const auto n = in.gcount();
            if (n <= 0) break;
            hasher.update(buffer, static_cast<size_t>(n));
            out.write(buffer, n);
            if (!out) {
                out.close();
                removeQuietly(tmp);
                throw WriteError("Failed writing to temp file: " + tmp.string());
            }
            file.size += static_cast<uintmax_t>(n);
        }

        if (in.bad()) {
            out.close();
            removeQuietly(tmp);
            throw WriteError("Failed reading upload stream for " + originalFilename);
        }

        out.flush();
        if (!out) {
            out.close();
            removeQuietly(tmp);
            throw WriteError("Failed flushing temp file: " + tmp.string());
        }
    }

    file.hash = hasher.final();
    file.ext = extensionFor(originalFilename);
    file.filename = file.hash + "." + file.ext;
    file.rel_path = file.hash.substr(0, 2) + "/" + file.filename;
    file.url = std::string(URL_PREFIX) + file.rel_path;
    file.path = root_ / file.hash.substr(0, 2) / file.filename;

    fs::create_directories(file.path.parent_path(), ec);
    if (ec) {
        removeQuietly(tmp);
        throw WriteError(fmt::format("Failed to create cache dir {}: {}", file.path.parent_path().string(), ec.message()));
    }

    if (fs::exists(file.path)) {
        removeQuietly(tmp);
        log::Registry::storage()->debug("[ContentStore] {} already cached", file.rel_path);
    } else {
        fs::rename(tmp, file.path, ec);
        if (ec) {
            removeQuietly(tmp);
            throw WriteError(fmt::format("Failed to move {} into place: {}", file.rel_path, ec.message()));
        }
        file.created = true;
        log::Registry::storage()->debug("[ContentStore] Stored {} ({} bytes)", file.rel_path, file.size);
    }

    writeInfo(file, originalFilename);
    return file;
}

StoredFile ContentStore::put(const std::string_view bytes, const std::string& originalFilename) const {
    std::istringstream in{std::string(bytes)};
    return put(in, originalFilename);
}

void ContentStore::writeInfo(const StoredFile& file, const std::string& originalFilename) const {
    const nlohmann::json info = {
        {"date", static_cast<long long>(util::now())},
        {"url", file.url},
        {"size", file.size},
        {"type", mime_.inferred(file.ext)},
        {"name", originalFilename}
    };

    const auto infoPath = file.path.parent_path() / (file.hash + ".info.json");
    const auto tmp = tempPath();
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) throw WriteError("Failed to open descriptor for writing: " + tmp.string());
        out << info.dump();
        if (!out) {
            out.close();
            removeQuietly(tmp);
            throw WriteError("Failed writing descriptor for " + file.rel_path);
        }
    }

    std::error_code ec;
    fs::rename(tmp, infoPath, ec);
    if (ec) {
        removeQuietly(tmp);
        throw WriteError(fmt::format("Failed to move descriptor {} into place: {}", infoPath.string(), ec.message()));
    }
}

fs::path ContentStore::resolve(const std::string& url) const {
    if (!url.starts_with(URL_PREFIX)) throw std::invalid_argument("Not a cache URL: " + url);

    const fs::path rel(url.substr(URL_PREFIX.size()));
    if (rel.empty() || rel.is_absolute()) throw std::invalid_argument("Invalid cache URL: " + url);
    for (const auto& part : rel)
        if (part == "..") throw std::invalid_argument("Cache URL escapes the cache root: " + url);

    return root_ / rel;
}

bool ContentStore::exists(const std::string& url) const {
    return fs::is_regular_file(resolve(url));
}

std::string ContentStore::read(const std::string& url) const {
    const auto path = resolve(url);
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("Cached file not found: " + path.string());
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

}
