#include "opendir/EncFormat.hpp"

#include <openssl/err.h>
#include <openssl/rand.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <system_error>

namespace fs = std::filesystem;

namespace opendir {

namespace {

const unsigned char kMagic[8] = {'C', 'O', 'K', 'A', 'C', 'E', 'N', 'C'};
constexpr std::size_t kSeqWidth = 4;
constexpr std::size_t kGroupIdLength = 16;
constexpr std::size_t kAesBlock = 16;

std::string opensslError(const char *what) {
    const unsigned long code = ERR_get_error();
    if (code == 0)
        return std::string(what) + " failed";
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return std::string(what) + " failed: " + buf;
}

bool endsWith(const std::string &s, const std::string &suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool isAlnum(char c) { return std::isalnum(static_cast<unsigned char>(c)); }

bool isHex(char c) { return std::isxdigit(static_cast<unsigned char>(c)); }

void putLe32(unsigned char *out, std::uint32_t v) {
    for (int i = 0; i < 4; ++i)
        out[i] = static_cast<unsigned char>(v >> (8 * i));
}

std::uint32_t getLe32(const unsigned char *in) {
    std::uint32_t v = 0;
    for (int i = 3; i >= 0; --i)
        v = (v << 8) | in[i];
    return v;
}

bool readExact(std::FILE *in, void *buf, std::size_t len, std::string &err) {
    if (std::fread(buf, 1, len, in) != len) {
        err = std::ferror(in) ? "Read failed: " + std::string(std::strerror(errno))
                              : "Truncated chunk header";
        return false;
    }
    return true;
}

bool writeAll(std::FILE *out, const void *buf, std::size_t len,
              std::string &err) {
    if (std::fwrite(buf, 1, len, out) != len) {
        err = "Write failed: " + std::string(std::strerror(errno));
        return false;
    }
    return true;
}

} // namespace

bool generateGroupId(std::string &out, std::string &err) {
    unsigned char raw[kGroupIdLength / 2];
    if (!randomBytes(raw, sizeof(raw), err))
        return false;
    static const char kDigits[] = "0123456789abcdef";
    out.clear();
    for (unsigned char b : raw) {
        out += kDigits[b >> 4];
        out += kDigits[b & 0x0f];
    }
    return true;
}

bool seqLabel(std::size_t index, std::string &out, std::string &err) {
    if (index > kEncMaxSeq) {
        err = "Sequence index " + std::to_string(index) +
              " exceeds maximum (" + std::to_string(kEncMaxSeq) + ")";
        return false;
    }
    out.assign(kSeqWidth, 'a');
    for (std::size_t i = kSeqWidth; i-- > 0;) {
        out[i] = static_cast<char>('a' + index % 26);
        index /= 26;
    }
    return true;
}

bool parseSeqLabel(const std::string &label, std::size_t &index) {
    if (label.size() != kSeqWidth)
        return false;
    std::size_t v = 0;
    for (char c : label) {
        if (c < 'a' || c > 'z')
            return false;
        v = v * 26 + static_cast<std::size_t>(c - 'a');
    }
    index = v;
    return true;
}

std::string keyPrefix(const std::string &password) {
    std::string out;
    for (std::size_t i = 0; i < password.size() && i < 6; ++i) {
        if (isAlnum(password[i]))
            out += password[i];
    }
    return out;
}

bool chunkFileName(const std::string &prefix, const std::string &groupId,
                   std::size_t seq, std::string &out, std::string &err) {
    std::string label;
    if (!seqLabel(seq, label, err))
        return false;
    out = prefix.empty() ? groupId + "_" + label + kEncExtension
                         : prefix + "_" + groupId + "_" + label + kEncExtension;
    return true;
}

bool parseEncFileName(const fs::path &path, EncFileInfo &out) {
    const std::string name = path.filename().string();
    const std::string ext = kEncExtension;
    if (!endsWith(name, ext))
        return false;
    std::string base = name.substr(0, name.size() - ext.size());
    if (base.size() < kGroupIdLength + 1 + kSeqWidth)
        return false;

    std::size_t seq = 0;
    if (!parseSeqLabel(base.substr(base.size() - kSeqWidth), seq))
        return false;
    base.resize(base.size() - kSeqWidth);
    if (base.back() != '_')
        return false;
    base.pop_back();
    if (base.size() < kGroupIdLength)
        return false;

    const std::string group = base.substr(base.size() - kGroupIdLength);
    for (char c : group) {
        if (!isHex(c))
            return false;
    }
    const std::string prefix = base.substr(0, base.size() - kGroupIdLength);
    if (!prefix.empty()) {
        if (prefix.size() < 2 || prefix.back() != '_')
            return false;
        for (std::size_t i = 0; i + 1 < prefix.size(); ++i) {
            if (!isAlnum(prefix[i]))
                return false;
        }
    }

    out.group_id = group;
    out.seq_index = seq;
    out.path = path;
    return true;
}

bool groupEncFiles(const fs::path &dir,
                   std::map<std::string, std::vector<EncFileInfo>> &out,
                   std::string &err) {
    out.clear();
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
        EncFileInfo info;
        if (parseEncFileName(entry.path(), info))
            out[info.group_id].push_back(std::move(info));
    }
    for (auto &group : out) {
        std::sort(group.second.begin(), group.second.end(),
                  [](const EncFileInfo &a, const EncFileInfo &b) {
                      return a.seq_index < b.seq_index;
                  });
    }
    return true;
}

bool randomBytes(unsigned char *out, std::size_t len, std::string &err) {
    if (RAND_bytes(out, static_cast<int>(len)) != 1) {
        err = opensslError("RAND_bytes");
        return false;
    }
    return true;
}

bool deriveKey(const std::string &password, const EncSalt &salt, EncKey &key,
               std::string &err) {
    if (!PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                           salt.data(), static_cast<int>(salt.size()),
                           kEncKdfIterations, EVP_sha512(),
                           static_cast<int>(key.size()), key.data())) {
        err = opensslError("PBKDF2");
        return false;
    }
    return true;
}

bool loadKeyFile(const fs::path &path, std::string &password,
                 std::string &err) {
    std::FILE *f = std::fopen(path.c_str(), "rb");
    if (!f) {
        err = "Cannot open '" + path.string() + "': " + std::strerror(errno);
        return false;
    }
    std::string data;
    char buf[4096];
    std::size_t n = 0;
    while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0)
        data.append(buf, n);
    const bool failed = std::ferror(f) != 0;
    std::fclose(f);
    if (failed) {
        err = "Read failed for '" + path.string() + "'";
        return false;
    }
    while (!data.empty() &&
           std::isspace(static_cast<unsigned char>(data.back())))
        data.pop_back();
    if (data.empty()) {
        err = "Key file is empty";
        return false;
    }
    password = std::move(data);
    return true;
}

bool writeEncHeader(std::FILE *out, const EncHeader &header,
                    std::string &err) {
    if (header.filename.size() > kEncMaxNameLength) {
        err = "Filename too long: " + std::to_string(header.filename.size()) +
              " bytes (max " + std::to_string(kEncMaxNameLength) + ")";
        return false;
    }
    unsigned char version[4];
    putLe32(version, kEncFormatVersion);
    const std::size_t len = header.filename.size();
    const unsigned char nameLen[2] = {static_cast<unsigned char>(len & 0xff),
                                      static_cast<unsigned char>(len >> 8)};
    return writeAll(out, kMagic, sizeof(kMagic), err) &&
           writeAll(out, version, sizeof(version), err) &&
           writeAll(out, header.salt.data(), header.salt.size(), err) &&
           writeAll(out, header.iv.data(), header.iv.size(), err) &&
           writeAll(out, nameLen, sizeof(nameLen), err) &&
           writeAll(out, header.filename.data(), len, err);
}

bool readEncHeader(std::FILE *in, EncHeader &header, std::string &err) {
    unsigned char magic[8];
    if (!readExact(in, magic, sizeof(magic), err))
        return false;
    if (std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
        err = "Invalid magic bytes in chunk header";
        return false;
    }
    unsigned char version[4];
    if (!readExact(in, version, sizeof(version), err))
        return false;
    if (getLe32(version) != kEncFormatVersion) {
        err = "Unsupported version: " + std::to_string(getLe32(version));
        return false;
    }
    unsigned char nameLen[2];
    if (!readExact(in, header.salt.data(), header.salt.size(), err) ||
        !readExact(in, header.iv.data(), header.iv.size(), err) ||
        !readExact(in, nameLen, sizeof(nameLen), err))
        return false;
    const std::size_t len = nameLen[0] | (std::size_t(nameLen[1]) << 8);
    if (len > kEncMaxNameLength) {
        err = "Filename length in header too long: " + std::to_string(len) +
              " bytes (max " + std::to_string(kEncMaxNameLength) + ")";
        return false;
    }
    header.filename.assign(len, '\0');
    return len == 0 || readExact(in, &header.filename[0], len, err);
}

ChunkCipher::ChunkCipher() : ctx_(EVP_CIPHER_CTX_new()) {}

ChunkCipher::~ChunkCipher() { EVP_CIPHER_CTX_free(ctx_); }

bool ChunkCipher::begin(Mode mode, const EncKey &key, const EncIv &iv,
                        std::string &err) {
    if (!ctx_) {
        err = "Cannot allocate cipher context";
        return false;
    }
    mode_ = mode;
    if (EVP_CipherInit_ex(ctx_, EVP_aes_256_cbc(), nullptr, key.data(),
                          iv.data(), mode == Mode::Encrypt ? 1 : 0) != 1) {
        err = opensslError("Cipher init");
        return false;
    }
    return true;
}

bool ChunkCipher::update(const unsigned char *data, std::size_t len,
                         std::vector<unsigned char> &out, std::string &err) {
    out.resize(len + kAesBlock);
    int written = 0;
    if (EVP_CipherUpdate(ctx_, out.data(), &written, data,
                         static_cast<int>(len)) != 1) {
        err = opensslError("Cipher update");
        out.clear();
        return false;
    }
    out.resize(static_cast<std::size_t>(written));
    return true;
}

bool ChunkCipher::finish(std::vector<unsigned char> &out, std::string &err) {
    out.resize(kAesBlock);
    int written = 0;
    if (EVP_CipherFinal_ex(ctx_, out.data(), &written) != 1) {
        ERR_clear_error();
        err = mode_ == Mode::Decrypt ? "Invalid PKCS7 padding"
                                     : "Cipher finalization failed";
        out.clear();
        return false;
    }
    out.resize(static_cast<std::size_t>(written));
    return true;
}

Md5Hasher::Md5Hasher() : ctx_(EVP_MD_CTX_new()) {
    ok_ = ctx_ && EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) == 1;
}

Md5Hasher::~Md5Hasher() { EVP_MD_CTX_free(ctx_); }

bool Md5Hasher::update(const unsigned char *data, std::size_t len) {
    if (ok_ && len > 0)
        ok_ = EVP_DigestUpdate(ctx_, data, len) == 1;
    return ok_;
}

bool Md5Hasher::finish(std::string &hex, std::string &err) {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (!ok_ || EVP_DigestFinal_ex(ctx_, digest, &len) != 1) {
        ok_ = false;
        err = opensslError("MD5");
        return false;
    }
    ok_ = false;
    static const char kDigits[] = "0123456789abcdef";
    hex.clear();
    for (unsigned int i = 0; i < len; ++i) {
        hex += kDigits[digest[i] >> 4];
        hex += kDigits[digest[i] & 0x0f];
    }
    return true;
}

} // namespace opendir
