// Pack/unpack engine for .cokacenc chunk groups. Packing reads each file
// twice: once for its MD5, once to encrypt. Every chunk carries the full
// metadata so any chunk identifies its group.
#include "opendir/EncPack.hpp"
#include "opendir/ConfigPaths.hpp"
#include "opendir/EncFormat.hpp"
#include "opendir/PathValidator.hpp"

#include <QByteArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QLatin1String>
#include <QString>

#include <fcntl.h>
#include <sys/stat.h>

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <functional>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace opendir {

namespace {

constexpr std::size_t kKeyBytes = 4096;
constexpr std::size_t kMaxMetadataSize = 1024 * 1024;

enum class StepResult { Ok, Failed, Cancelled };

using ByteCallback = std::function<void(std::uint64_t)>;

// Owns a FILE*; close() reports the flush result for writers.
class StdioFile {
public:
    StdioFile() = default;
    ~StdioFile() {
        if (f_)
            std::fclose(f_);
    }
    StdioFile(const StdioFile &) = delete;
    StdioFile &operator=(const StdioFile &) = delete;

    bool open(const fs::path &path, const char *mode, std::string &err) {
        f_ = std::fopen(path.c_str(), mode);
        if (!f_) {
            err = "Cannot open '" + path.string() +
                  "': " + std::strerror(errno);
            return false;
        }
        return true;
    }
    bool close(std::string &err) {
        std::FILE *f = f_;
        f_ = nullptr;
        if (f && std::fclose(f) != 0) {
            err = "Write failed: " + std::string(std::strerror(errno));
            return false;
        }
        return true;
    }
    std::FILE *get() const { return f_; }

private:
    std::FILE *f_ = nullptr;
};

struct ChunkMeta {
    std::string group_id;
    std::string filename;
    std::uint64_t size = 0;
    std::string md5;
    std::int64_t mtime = 0;
    std::uint32_t perm = 0;
    std::size_t chunks = 0;
    std::size_t index = 0;
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
};

QByteArray metaToJson(const ChunkMeta &m) {
    QJsonObject o;
    o.insert("v", qint64(kEncFormatVersion));
    o.insert("group", QString::fromStdString(m.group_id));
    o.insert("name", QString::fromStdString(m.filename));
    o.insert("size", qint64(m.size));
    o.insert("md5", QString::fromStdString(m.md5));
    o.insert("mtime", qint64(m.mtime));
    o.insert("perm", qint64(m.perm));
    o.insert("chunks", qint64(m.chunks));
    o.insert("idx", qint64(m.index));
    o.insert("offset", qint64(m.offset));
    o.insert("len", qint64(m.length));
    return QJsonDocument(o).toJson(QJsonDocument::Compact);
}

bool metaFromJson(const std::string &bytes, ChunkMeta &m, std::string &err) {
    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(
        QByteArray(bytes.data(), static_cast<qsizetype>(bytes.size())), &pe);
    if (pe.error != QJsonParseError::NoError || !doc.isObject()) {
        err = "Metadata parse error: " + pe.errorString().toStdString();
        return false;
    }
    const QJsonObject o = doc.object();
    for (const char *key : {"group", "name", "md5"}) {
        if (!o.value(QLatin1String(key)).isString()) {
            err = std::string("Metadata parse error: missing '") + key + "'";
            return false;
        }
    }
    for (const char *key : {"v", "size", "mtime", "perm", "chunks", "idx",
                            "offset", "len"}) {
        const QJsonValue v = o.value(QLatin1String(key));
        if (!v.isDouble() || v.toInteger(-1) < 0) {
            err = std::string("Metadata parse error: missing '") + key + "'";
            return false;
        }
    }
    m.group_id = o.value("group").toString().toStdString();
    m.filename = o.value("name").toString().toStdString();
    m.md5 = o.value("md5").toString().toStdString();
    m.size = std::uint64_t(o.value("size").toInteger());
    m.mtime = o.value("mtime").toInteger();
    m.perm = std::uint32_t(o.value("perm").toInteger());
    m.chunks = std::size_t(o.value("chunks").toInteger());
    m.index = std::size_t(o.value("idx").toInteger());
    m.offset = std::uint64_t(o.value("offset").toInteger());
    m.length = std::uint64_t(o.value("len").toInteger());
    return true;
}

bool writeBytes(std::FILE *out, const std::vector<unsigned char> &bytes,
                std::string &err) {
    if (!bytes.empty() &&
        std::fwrite(bytes.data(), 1, bytes.size(), out) != bytes.size()) {
        err = "Write failed: " + std::string(std::strerror(errno));
        return false;
    }
    return true;
}

StepResult fileMd5(const fs::path &path, const CancelFlag &cancel,
                   std::string &hex, std::string &err) {
    StdioFile in;
    if (!in.open(path, "rb", err))
        return StepResult::Failed;
    Md5Hasher md5;
    std::vector<unsigned char> buf(kCopyBufferSize);
    while (true) {
        if (isCancelled(cancel))
            return StepResult::Cancelled;
        const std::size_t n = std::fread(buf.data(), 1, buf.size(), in.get());
        if (n == 0)
            break;
        if (!md5.update(buf.data(), n)) {
            err = "MD5 update failed";
            return StepResult::Failed;
        }
    }
    if (std::ferror(in.get())) {
        err = "Read failed for '" + path.string() + "'";
        return StepResult::Failed;
    }
    return md5.finish(hex, err) ? StepResult::Ok : StepResult::Failed;
}

// Writes one chunk: header, then the encrypted metadata prefix and the
// next meta.length bytes of in.
StepResult writeChunk(const fs::path &chunkPath, std::FILE *in,
                      const ChunkMeta &meta, const std::string &password,
                      const CancelFlag &cancel, const ByteCallback &onBytes,
                      bool &created, std::string &err) {
    StdioFile out;
    // "x": an existing chunk with the same name is never overwritten.
    created = out.open(chunkPath, "wbx", err);
    if (!created)
        return StepResult::Failed;

    EncHeader header;
    header.filename = meta.filename;
    EncKey key;
    if (!randomBytes(header.salt.data(), header.salt.size(), err) ||
        !randomBytes(header.iv.data(), header.iv.size(), err) ||
        !deriveKey(password, header.salt, key, err) ||
        !writeEncHeader(out.get(), header, err))
        return StepResult::Failed;

    ChunkCipher cipher;
    if (!cipher.begin(ChunkCipher::Mode::Encrypt, key, header.iv, err))
        return StepResult::Failed;

    const QByteArray json = metaToJson(meta);
    std::vector<unsigned char> plain(4);
    const std::uint32_t metaLen = static_cast<std::uint32_t>(json.size());
    for (int i = 0; i < 4; ++i)
        plain[std::size_t(i)] = static_cast<unsigned char>(metaLen >> (8 * i));
    plain.insert(plain.end(), json.begin(), json.end());

    std::vector<unsigned char> sealed;
    if (!cipher.update(plain.data(), plain.size(), sealed, err) ||
        !writeBytes(out.get(), sealed, err))
        return StepResult::Failed;

    std::vector<unsigned char> buf(kCopyBufferSize);
    std::uint64_t remaining = meta.length;
    while (remaining > 0) {
        if (isCancelled(cancel))
            return StepResult::Cancelled;
        const std::size_t want =
            static_cast<std::size_t>(std::min<std::uint64_t>(buf.size(), remaining));
        const std::size_t n = std::fread(buf.data(), 1, want, in);
        if (n == 0) {
            err = std::ferror(in) ? "Read failed"
                                  : "File shrank while encrypting";
            return StepResult::Failed;
        }
        if (!cipher.update(buf.data(), n, sealed, err) ||
            !writeBytes(out.get(), sealed, err))
            return StepResult::Failed;
        remaining -= n;
        onBytes(n);
    }
    if (!cipher.finish(sealed, err) || !writeBytes(out.get(), sealed, err))
        return StepResult::Failed;
    return out.close(err) ? StepResult::Ok : StepResult::Failed;
}

StepResult packFile(const fs::path &path, const std::string &name,
                    const fs::path &dir, const std::string &password,
                    std::uint64_t splitSize, const CancelFlag &cancel,
                    const ByteCallback &onBytes, std::string &err) {
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        err = "Cannot read '" + path.string() + "': " + std::strerror(errno);
        return StepResult::Failed;
    }
    ChunkMeta meta;
    meta.filename = name;
    meta.size = static_cast<std::uint64_t>(st.st_size);
    meta.mtime = static_cast<std::int64_t>(st.st_mtime);
    meta.perm = static_cast<std::uint32_t>(st.st_mode);
    meta.chunks = meta.size == 0
                      ? 1
                      : static_cast<std::size_t>((meta.size + splitSize - 1) /
                                                 splitSize);
    if (meta.chunks > kEncMaxSeq + 1) {
        err = "Too many chunks for split size: " + std::to_string(meta.chunks);
        return StepResult::Failed;
    }

    StepResult r = fileMd5(path, cancel, meta.md5, err);
    if (r != StepResult::Ok)
        return r;
    if (!generateGroupId(meta.group_id, err))
        return StepResult::Failed;
    const std::string prefix = keyPrefix(password);

    StdioFile in;
    if (!in.open(path, "rb", err))
        return StepResult::Failed;

    std::vector<fs::path> created;
    for (std::size_t i = 0; i < meta.chunks && r == StepResult::Ok; ++i) {
        meta.index = i;
        meta.offset = std::uint64_t(i) * splitSize;
        meta.length = meta.size == 0
                          ? 0
                          : std::min<std::uint64_t>(splitSize,
                                                    meta.size - meta.offset);
        std::string chunkName;
        if (!chunkFileName(prefix, meta.group_id, i, chunkName, err)) {
            r = StepResult::Failed;
            break;
        }
        const fs::path chunkPath = dir / chunkName;
        bool opened = false;
        r = writeChunk(chunkPath, in.get(), meta, password, cancel, onBytes,
                       opened, err);
        if (opened)
            created.push_back(chunkPath);
    }
    if (r != StepResult::Ok) {
        for (const fs::path &p : created) {
            std::error_code ec;
            fs::remove(p, ec);
        }
    }
    return r;
}

// Splits the decrypted stream into the length-prefixed metadata and the
// file data that follows it.
class PlaintextSplitter {
public:
    explicit PlaintextSplitter(
        std::function<bool(const unsigned char *, std::size_t)> onData)
        : onData_(std::move(onData)) {}

    bool feed(const unsigned char *data, std::size_t len, std::string &err) {
        std::size_t pos = 0;
        while (pos < len) {
            if (lenFilled_ < 4) {
                const std::size_t take = std::min(4 - lenFilled_, len - pos);
                std::memcpy(lenBuf_ + lenFilled_, data + pos, take);
                lenFilled_ += take;
                pos += take;
                if (lenFilled_ == 4) {
                    metaLen_ = std::size_t(lenBuf_[0]) |
                               std::size_t(lenBuf_[1]) << 8 |
                               std::size_t(lenBuf_[2]) << 16 |
                               std::size_t(lenBuf_[3]) << 24;
                    if (metaLen_ > kMaxMetadataSize) {
                        err = "Metadata parse error: metadata too large";
                        return false;
                    }
                }
            } else if (meta_.size() < metaLen_) {
                const std::size_t take =
                    std::min(metaLen_ - meta_.size(), len - pos);
                meta_.append(reinterpret_cast<const char *>(data + pos), take);
                pos += take;
            } else {
                if (!onData_(data + pos, len - pos)) {
                    err = "Write failed: " + std::string(std::strerror(errno));
                    return false;
                }
                pos = len;
            }
        }
        return true;
    }

    bool metadataComplete() const {
        return lenFilled_ == 4 && meta_.size() == metaLen_;
    }
    const std::string &metadata() const { return meta_; }

private:
    std::function<bool(const unsigned char *, std::size_t)> onData_;
    unsigned char lenBuf_[4] = {};
    std::size_t lenFilled_ = 0;
    std::size_t metaLen_ = 0;
    std::string meta_;
};

struct UnpackOutcome {
    std::string name;
    std::string warning;
};

StepResult decryptChunks(const std::vector<EncFileInfo> &chunks,
                         std::FILE *out, const std::string &password,
                         const CancelFlag &cancel, const ProgressSender &tx,
                         Md5Hasher &md5, ChunkMeta &first, std::string &err) {
    std::uint64_t written = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        StdioFile in;
        EncHeader header;
        EncKey key;
        ChunkCipher cipher;
        if (!in.open(chunks[i].path, "rb", err) ||
            !readEncHeader(in.get(), header, err) ||
            !deriveKey(password, header.salt, key, err) ||
            !cipher.begin(ChunkCipher::Mode::Decrypt, key, header.iv, err))
            return StepResult::Failed;

        PlaintextSplitter splitter(
            [&](const unsigned char *data, std::size_t len) {
                if (std::fwrite(data, 1, len, out) != len ||
                    !md5.update(data, len))
                    return false;
                written += len;
                if (i > 0)
                    tx.send(ProgressMessage::fileProgress(written, first.size));
                return true;
            });
        std::vector<unsigned char> buf(kCopyBufferSize);
        std::vector<unsigned char> plain;
        while (true) {
            if (isCancelled(cancel))
                return StepResult::Cancelled;
            const std::size_t n =
                std::fread(buf.data(), 1, buf.size(), in.get());
            if (n == 0)
                break;
            if (!cipher.update(buf.data(), n, plain, err) ||
                !splitter.feed(plain.data(), plain.size(), err))
                return StepResult::Failed;
        }
        if (std::ferror(in.get())) {
            err = "Read failed for '" + chunks[i].path.string() + "'";
            return StepResult::Failed;
        }
        if (!cipher.finish(plain, err) ||
            !splitter.feed(plain.data(), plain.size(), err))
            return StepResult::Failed;
        if (!splitter.metadataComplete()) {
            err = "Metadata parse error: Incomplete metadata in chunk";
            return StepResult::Failed;
        }

        ChunkMeta meta;
        if (!metaFromJson(splitter.metadata(), meta, err))
            return StepResult::Failed;
        if (meta.index != i) {
            err = "Metadata parse error: Chunk index mismatch: expected " +
                  std::to_string(i) + ", got " + std::to_string(meta.index);
            return StepResult::Failed;
        }
        if (i == 0) {
            first = meta;
            tx.send(ProgressMessage::fileStarted(first.filename));
            tx.send(ProgressMessage::fileProgress(written, first.size));
        } else if (meta.filename != first.filename || meta.md5 != first.md5) {
            err = "Metadata parse error: Inconsistent metadata across chunks";
            return StepResult::Failed;
        }
    }
    if (first.chunks > chunks.size()) {
        std::string label;
        if (!seqLabel(chunks.size(), label, err))
            return StepResult::Failed;
        err = "Missing chunk in sequence: expected seq " + label +
              " but not found";
        return StepResult::Failed;
    }
    if (first.chunks < chunks.size()) {
        err = "Metadata parse error: expected " + std::to_string(first.chunks) +
              " chunks, found " + std::to_string(chunks.size());
        return StepResult::Failed;
    }
    return StepResult::Ok;
}

StepResult unpackGroup(const fs::path &dir,
                       const std::vector<EncFileInfo> &chunks,
                       const std::string &password, const CancelFlag &cancel,
                       const ProgressSender &tx, UnpackOutcome &outcome,
                       std::string &err) {
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].seq_index != i) {
            std::string label;
            if (!seqLabel(i, label, err))
                return StepResult::Failed;
            err = "Missing chunk in sequence: expected seq " + label +
                  " but not found";
            return StepResult::Failed;
        }
    }

    const fs::path temp = dir / ("." + chunks.front().group_id + ".unpacking");
    StdioFile out;
    if (!out.open(temp, "wb", err))
        return StepResult::Failed;

    Md5Hasher md5;
    ChunkMeta meta;
    std::string actual;
    StepResult r =
        decryptChunks(chunks, out.get(), password, cancel, tx, md5, meta, err);
    if (r == StepResult::Ok && !out.close(err))
        r = StepResult::Failed;
    if (r == StepResult::Ok && !md5.finish(actual, err))
        r = StepResult::Failed;
    if (r == StepResult::Ok && actual != meta.md5) {
        err = "MD5 mismatch: expected " + meta.md5 + ", got " + actual;
        r = StepResult::Failed;
    }
    if (r == StepResult::Ok) {
        std::error_code ec;
        const std::uint64_t size = fs::file_size(temp, ec);
        if (ec || size != meta.size) {
            err = "Size mismatch: expected " + std::to_string(meta.size) +
                  ", got " + (ec ? std::string("unknown") : std::to_string(size));
            r = StepResult::Failed;
        }
    }
    std::string why;
    if (r == StepResult::Ok && !isValidFilename(meta.filename, &why)) {
        err = "Invalid file name in chunk metadata: " + why;
        r = StepResult::Failed;
    }
    if (r != StepResult::Ok) {
        std::error_code ec;
        fs::remove(temp, ec);
        return r;
    }

    const fs::path target = dir / meta.filename;
    if (std::rename(temp.c_str(), target.c_str()) != 0) {
        err = "Cannot rename to '" + target.string() +
              "': " + std::strerror(errno);
        std::error_code ec;
        fs::remove(temp, ec);
        return StepResult::Failed;
    }
    outcome.name = meta.filename;
    if (meta.perm != 0 && ::chmod(target.c_str(), meta.perm & 07777) != 0)
        outcome.warning = "Restored but failed to set permissions: " +
                          std::string(std::strerror(errno));
    if (meta.mtime > 0) {
        struct timespec times[2];
        times[0].tv_sec = static_cast<time_t>(meta.mtime);
        times[0].tv_nsec = 0;
        times[1] = times[0];
        if (::utimensat(AT_FDCWD, target.c_str(), times, 0) != 0)
            outcome.warning = "Restored but failed to set modification time: " +
                              std::string(std::strerror(errno));
    }
    return StepResult::Ok;
}

bool loadKeyOrReport(const fs::path &keyPath, const ProgressSender &tx,
                     std::string &password) {
    std::string err;
    if (loadKeyFile(keyPath, password, err))
        return true;
    tx.send(ProgressMessage::totalProgress(0, 1, 0, 0));
    tx.send(ProgressMessage::error("", "Key file error: " + err));
    tx.send(ProgressMessage::completed(0, 1));
    return false;
}

void reportDirError(const ProgressSender &tx, const std::string &err) {
    tx.send(ProgressMessage::totalProgress(0, 1, 0, 0));
    tx.send(ProgressMessage::error("", err));
    tx.send(ProgressMessage::completed(0, 1));
}

bool endsWith(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

bool listPackableFiles(const fs::path &dir, std::vector<std::string> &names,
                       std::string &err) {
    names.clear();
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        err = "Read dir error: " + ec.message();
        return false;
    }
    for (const fs::directory_entry &entry : it) {
        std::error_code fec;
        if (!entry.is_regular_file(fec))
            continue;
        const std::string name = entry.path().filename().string();
        if (name.empty() || name.front() == '.' ||
            endsWith(name, kEncExtension))
            continue;
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return true;
}

fs::path encKeyPath() { return configRoot() / "credential" / "cokacenc.key"; }

bool ensureEncKey(fs::path &keyPath, std::string &err) {
    keyPath = encKeyPath();
    if (!ensurePrivateDirectory(keyPath.parent_path(), err))
        return false;
    std::error_code ec;
    if (fs::exists(keyPath, ec))
        return true;

    std::vector<unsigned char> raw(kKeyBytes);
    if (!randomBytes(raw.data(), raw.size(), err))
        return false;
    const QByteArray encoded =
        QByteArray(reinterpret_cast<const char *>(raw.data()),
                   static_cast<qsizetype>(raw.size()))
            .toBase64();

    StdioFile f;
    if (!f.open(keyPath, "wbx", err))
        return false;
    fs::permissions(keyPath, fs::perms::owner_read | fs::perms::owner_write,
                    fs::perm_options::replace, ec);
    bool ok = !ec;
    if (ec)
        err = "Cannot restrict permissions of '" + keyPath.string() +
              "': " + ec.message();
    if (ok && std::fwrite(encoded.constData(), 1, std::size_t(encoded.size()),
                          f.get()) != std::size_t(encoded.size())) {
        err = "Write failed for '" + keyPath.string() +
              "': " + std::strerror(errno);
        ok = false;
    }
    std::string closeErr;
    if (!f.close(closeErr) && ok) {
        err = closeErr;
        ok = false;
    }
    if (!ok)
        fs::remove(keyPath, ec);
    return ok;
}

void packDirectoryWithProgress(const fs::path &dir, const fs::path &keyPath,
                               const CancelFlag &cancel,
                               const ProgressSender &tx,
                               std::uint64_t splitSize) {
    std::string password;
    if (!loadKeyOrReport(keyPath, tx, password))
        return;
    splitSize = std::max<std::uint64_t>(splitSize, 1);

    std::vector<std::string> names;
    std::string err;
    if (!listPackableFiles(dir, names, err)) {
        reportDirError(tx, err);
        return;
    }
    struct Entry {
        std::string name;
        std::uint64_t size;
    };
    std::vector<Entry> entries;
    std::uint64_t totalBytes = 0;
    for (const std::string &name : names) {
        std::error_code ec;
        const std::uint64_t size = fs::file_size(dir / name, ec);
        entries.push_back({name, ec ? 0 : size});
        totalBytes += entries.back().size;
    }
    if (entries.empty()) {
        tx.send(ProgressMessage::completed(0, 0));
        return;
    }

    const std::size_t total = entries.size();
    std::size_t success = 0;
    std::size_t failure = 0;
    std::uint64_t doneBytes = 0;
    tx.send(ProgressMessage::totalProgress(0, total, 0, totalBytes));

    for (std::size_t i = 0; i < total; ++i) {
        const Entry &e = entries[i];
        if (isCancelled(cancel)) {
            tx.send(ProgressMessage::error(e.name, kCancelledMessage));
            ++failure;
            break;
        }
        tx.send(ProgressMessage::fileStarted(e.name));
        std::uint64_t fileBytes = 0;
        const ByteCallback onBytes = [&](std::uint64_t n) {
            fileBytes += n;
            tx.send(ProgressMessage::fileProgress(fileBytes, e.size));
            tx.send(ProgressMessage::totalProgress(
                success + failure, total, doneBytes + fileBytes, totalBytes));
        };

        err.clear();
        const fs::path path = dir / e.name;
        const StepResult r = packFile(path, e.name, dir, password, splitSize,
                                      cancel, onBytes, err);
        doneBytes += e.size;
        if (r == StepResult::Ok) {
            std::error_code rec;
            if (!fs::remove(path, rec) || rec)
                tx.send(ProgressMessage::error(
                    e.name, "Encrypted but failed to delete original: " +
                                (rec ? rec.message() : std::string("not found"))));
            ++success;
            tx.send(ProgressMessage::fileCompleted(e.name));
        } else {
            ++failure;
            tx.send(ProgressMessage::error(
                e.name, r == StepResult::Cancelled ? kCancelledMessage : err));
        }
        tx.send(ProgressMessage::totalProgress(success + failure, total,
                                               doneBytes, totalBytes));
        if (r == StepResult::Cancelled)
            break;
    }
    tx.send(ProgressMessage::completed(success, failure));
}

void unpackDirectoryWithProgress(const fs::path &dir, const fs::path &keyPath,
                                 const CancelFlag &cancel,
                                 const ProgressSender &tx) {
    std::string password;
    if (!loadKeyOrReport(keyPath, tx, password))
        return;

    std::map<std::string, std::vector<EncFileInfo>> groups;
    std::string err;
    if (!groupEncFiles(dir, groups, err)) {
        reportDirError(tx, err);
        return;
    }
    if (groups.empty()) {
        tx.send(ProgressMessage::completed(0, 0));
        return;
    }

    const std::size_t total = groups.size();
    std::size_t success = 0;
    std::size_t failure = 0;
    tx.send(ProgressMessage::totalProgress(0, total, 0, 0));

    for (const auto &group : groups) {
        const std::string label = group.first.substr(0, 8) + "...";
        if (isCancelled(cancel)) {
            tx.send(ProgressMessage::error(label, kCancelledMessage));
            ++failure;
            break;
        }
        tx.send(ProgressMessage::fileStarted(label));

        UnpackOutcome outcome;
        err.clear();
        const StepResult r = unpackGroup(dir, group.second, password, cancel,
                                         tx, outcome, err);
        if (r == StepResult::Ok) {
            if (!outcome.warning.empty())
                tx.send(ProgressMessage::error(outcome.name, outcome.warning));
            for (const EncFileInfo &chunk : group.second) {
                std::error_code ec;
                if (!fs::remove(chunk.path, ec) || ec)
                    tx.send(ProgressMessage::error(
                        chunk.path.filename().string(),
                        "Decrypted but failed to delete chunk: " +
                            (ec ? ec.message() : std::string("not found"))));
            }
            ++success;
            tx.send(ProgressMessage::fileCompleted(outcome.name));
        } else {
            ++failure;
            tx.send(ProgressMessage::error(
                group.first,
                r == StepResult::Cancelled ? kCancelledMessage : err));
        }
        tx.send(ProgressMessage::totalProgress(success + failure, total, 0, 0));
        if (r == StepResult::Cancelled)
            break;
    }
    tx.send(ProgressMessage::completed(success, failure));
}

} // namespace opendir
