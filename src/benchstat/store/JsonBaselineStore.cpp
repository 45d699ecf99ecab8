#include "JsonBaselineStore.h"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <system_error>

#include <boost/algorithm/string.hpp>

#include "BaselineRecordSerializer.h"
#include "BenchStatException.h"

namespace fs = std::filesystem;

namespace benchstat
{
namespace store
{

using regression::BaselineRecord;

namespace
{
    // Identifiers and tags become path components.
    void requireSafeComponent(const std::string& op, const std::string& benchmarkId,
                              const char* what, const std::string& value)
    {
        if (value.empty() || value == "." || value == ".." ||
            value.find_first_of("/\\") != std::string::npos)
        {
            throw InvalidParameterException(op, benchmarkId, what,
                                            "'" + value + "' is not usable as a file name");
        }
    }

    // Filesystem queries never throw filesystem_error out of the store.
    bool pathExists(const fs::path& path, const std::string& op, const std::string& benchmarkId)
    {
        std::error_code ec;
        const bool found = fs::exists(path, ec);
        if (ec)
            throw StoreException(op, benchmarkId, "cannot stat " + path.string() + ": " + ec.message());
        return found;
    }

    bool isDirectory(const fs::path& path, const std::string& op, const std::string& benchmarkId)
    {
        std::error_code ec;
        const bool dir = fs::is_directory(path, ec);
        if (ec && ec != std::errc::no_such_file_or_directory && ec != std::errc::not_a_directory)
            throw StoreException(op, benchmarkId, "cannot stat " + path.string() + ": " + ec.message());
        return dir;
    }
}

JsonBaselineStore::JsonBaselineStore(fs::path root)
    : mRoot(std::move(root))
{
    std::error_code ec;
    fs::create_directories(mRoot, ec);
    if (ec)
    {
        throw StoreException("JsonBaselineStore", "",
                             "cannot create store root " + mRoot.string() + ": " + ec.message());
    }
}

fs::path JsonBaselineStore::benchmarkDir(const std::string& benchmarkId) const
{
    return mRoot / benchmarkId;
}

std::optional<BaselineRecord> JsonBaselineStore::load(const std::string& benchmarkId) const
{
    requireSafeComponent("JsonBaselineStore::load", benchmarkId, "benchmarkId", benchmarkId);

    std::lock_guard<std::mutex> lock(mMutex);
    const std::optional<std::string> tag = readLatestTag(benchmarkId);
    if (!tag)
        return std::nullopt;

    const fs::path file = benchmarkDir(benchmarkId) / (*tag + kRecordExtension);
    if (!pathExists(file, "JsonBaselineStore::load", benchmarkId))
    {
        throw StoreException("JsonBaselineStore::load", benchmarkId,
                             "LATEST names " + *tag + " but " + file.string() + " is missing");
    }
    return BaselineRecordSerializer::fromJson(readFile(file, benchmarkId));
}

std::optional<BaselineRecord> JsonBaselineStore::load(const std::string& benchmarkId,
                                                      const std::string& dateTag) const
{
    requireSafeComponent("JsonBaselineStore::load", benchmarkId, "benchmarkId", benchmarkId);
    requireSafeComponent("JsonBaselineStore::load", benchmarkId, "dateTag", dateTag);

    std::lock_guard<std::mutex> lock(mMutex);
    const fs::path file = benchmarkDir(benchmarkId) / (dateTag + kRecordExtension);
    if (!pathExists(file, "JsonBaselineStore::load", benchmarkId))
        return std::nullopt;
    return BaselineRecordSerializer::fromJson(readFile(file, benchmarkId));
}

void JsonBaselineStore::save(const BaselineRecord& record)
{
    const std::string& id = record.getBenchmarkId();
    const std::string tag = record.getDateTag();
    requireSafeComponent("JsonBaselineStore::save", id, "benchmarkId", id);

    std::lock_guard<std::mutex> lock(mMutex);
    const fs::path dir = benchmarkDir(id);
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec)
    {
        throw StoreException("JsonBaselineStore::save", id,
                             "cannot create " + dir.string() + ": " + ec.message());
    }

    const fs::path file = dir / (tag + kRecordExtension);
    if (pathExists(file, "JsonBaselineStore::save", id))
    {
        throw StoreException("JsonBaselineStore::save", id,
                             "record " + tag + " already exists; baselines are immutable");
    }

    writeAtomically(file, BaselineRecordSerializer::toJson(record), id);

    const std::optional<std::string> latest = readLatestTag(id);
    if (!latest || *latest < tag)
        writeAtomically(dir / kLatestFileName, tag + "\n", id);
}

std::vector<std::string> JsonBaselineStore::history(const std::string& benchmarkId) const
{
    requireSafeComponent("JsonBaselineStore::history", benchmarkId, "benchmarkId", benchmarkId);

    std::lock_guard<std::mutex> lock(mMutex);
    std::vector<std::string> tags;
    const fs::path dir = benchmarkDir(benchmarkId);
    if (!isDirectory(dir, "JsonBaselineStore::history", benchmarkId))
        return tags;

    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        const fs::path& p = it->path();
        if (it->is_regular_file() && p.extension() == kRecordExtension)
            tags.push_back(p.stem().string());
    }
    if (ec)
    {
        throw StoreException("JsonBaselineStore::history", benchmarkId,
                             "cannot list " + dir.string() + ": " + ec.message());
    }

    std::sort(tags.begin(), tags.end());
    return tags;
}

std::optional<std::string> JsonBaselineStore::readLatestTag(const std::string& benchmarkId) const
{
    const fs::path pointer = benchmarkDir(benchmarkId) / kLatestFileName;
    if (!pathExists(pointer, "JsonBaselineStore", benchmarkId))
        return std::nullopt;

    std::string tag = readFile(pointer, benchmarkId);
    boost::algorithm::trim(tag);
    if (tag.empty())
        throw StoreException("JsonBaselineStore", benchmarkId, pointer.string() + " is empty");
    return tag;
}

void JsonBaselineStore::writeAtomically(const fs::path& target,
                                        const std::string& content,
                                        const std::string& benchmarkId)
{
    fs::path tmp = target;
    tmp += ".tmp";

    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        if (!out.is_open())
            throw StoreException("JsonBaselineStore::save", benchmarkId,
                                 "cannot open " + tmp.string() + " for writing");
        out << content;
        out.flush();
        if (!out)
            throw StoreException("JsonBaselineStore::save", benchmarkId,
                                 "write to " + tmp.string() + " failed");
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec)
    {
        const std::string reason = ec.message();
        fs::remove(tmp, ec);
        throw StoreException("JsonBaselineStore::save", benchmarkId,
                             "cannot move " + tmp.string() + " into place: " + reason);
    }
}

std::string JsonBaselineStore::readFile(const fs::path& path, const std::string& benchmarkId)
{
    std::ifstream file(path);
    if (!file.is_open())
        throw StoreException("JsonBaselineStore", benchmarkId, "cannot open " + path.string());

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    return content;
}

} // namespace store
} // namespace benchstat
