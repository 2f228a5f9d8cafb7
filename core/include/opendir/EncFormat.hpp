// On-disk layout of encrypted chunk files. A chunk is
//   "COKACENC" | u32 version | salt[16] | iv[16] | u16 name_len | name
// followed by AES-256-CBC ciphertext of
//   u32 meta_len | metadata JSON | file data slice
// All integers are little-endian.
#pragma once

#include <openssl/evp.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace opendir {

constexpr const char *kEncExtension = ".cokacenc";
constexpr std::uint32_t kEncFormatVersion = 2;
constexpr std::size_t kEncMaxSeq = 456975; // "zzzz"
constexpr std::size_t kEncMaxNameLength = 4096;
constexpr int kEncKdfIterations = 100000;

using EncSalt = std::array<unsigned char, 16>;
using EncIv = std::array<unsigned char, 16>;
using EncKey = std::array<unsigned char, 32>;

// 8 random bytes as 16 lowercase hex digits.
bool generateGroupId(std::string &out, std::string &err);

// 0 -> "aaaa", 27 -> "aabb". Fails past kEncMaxSeq.
bool seqLabel(std::size_t index, std::string &out, std::string &err);
bool parseSeqLabel(const std::string &label, std::size_t &index);

// ASCII alphanumerics among the first six bytes of the key.
std::string keyPrefix(const std::string &password);

// "[prefix_]<group>_<seq>.cokacenc"
bool chunkFileName(const std::string &prefix, const std::string &groupId,
                   std::size_t seq, std::string &out, std::string &err);

struct EncFileInfo {
    std::string group_id;
    std::size_t seq_index = 0;
    std::filesystem::path path;
};

bool parseEncFileName(const std::filesystem::path &path, EncFileInfo &out);

// Regular files in dir that parse as chunk names, grouped and ordered by
// sequence.
bool groupEncFiles(const std::filesystem::path &dir,
                   std::map<std::string, std::vector<EncFileInfo>> &out,
                   std::string &err);

bool randomBytes(unsigned char *out, std::size_t len, std::string &err);

// PBKDF2-HMAC-SHA512.
bool deriveKey(const std::string &password, const EncSalt &salt, EncKey &key,
               std::string &err);

// Reads the key file and strips trailing whitespace.
bool loadKeyFile(const std::filesystem::path &path, std::string &password,
                 std::string &err);

struct EncHeader {
    EncSalt salt{};
    EncIv iv{};
    std::string filename;
};

bool writeEncHeader(std::FILE *out, const EncHeader &header, std::string &err);
bool readEncHeader(std::FILE *in, EncHeader &header, std::string &err);

// AES-256-CBC with PKCS7 padding over an EVP_CIPHER_CTX.
class ChunkCipher {
public:
    enum class Mode { Encrypt, Decrypt };

    ChunkCipher();
    ~ChunkCipher();
    ChunkCipher(const ChunkCipher &) = delete;
    ChunkCipher &operator=(const ChunkCipher &) = delete;

    bool begin(Mode mode, const EncKey &key, const EncIv &iv,
               std::string &err);
    // Replaces out with whatever whole blocks are ready.
    bool update(const unsigned char *data, std::size_t len,
                std::vector<unsigned char> &out, std::string &err);
    // Final block; decryption fails here on bad padding.
    bool finish(std::vector<unsigned char> &out, std::string &err);

private:
    EVP_CIPHER_CTX *ctx_ = nullptr;
    Mode mode_ = Mode::Encrypt;
};

class Md5Hasher {
public:
    Md5Hasher();
    ~Md5Hasher();
    Md5Hasher(const Md5Hasher &) = delete;
    Md5Hasher &operator=(const Md5Hasher &) = delete;

    bool update(const unsigned char *data, std::size_t len);
    // 32 lowercase hex digits.
    bool finish(std::string &hex, std::string &err);

private:
    EVP_MD_CTX *ctx_ = nullptr;
    bool ok_ = false;
};

} // namespace opendir
