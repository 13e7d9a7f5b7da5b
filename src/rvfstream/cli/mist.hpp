#pragma once
#include <string>
#include <vector>
#include <sstream>
#include <iomanip>
#include <filesystem>
#include <fstream>
#include <chrono>
#include <ctime>
#include <random>
#include <cstdint>

#include <openssl/evp.h>
#include <zlib.h>

/* Run manifest helpers: ids, timestamps, JSON escaping, artifact digests. */
namespace mist {

/* One file produced by a run.
   - sha256 : hex digest (OpenSSL)
   - crc32  : hex CRC-32 (zlib)
   - kind   : e.g. "image/png", "record/rvr" */
struct Artifact {
    std::string path;
    std::uintmax_t size{0};
    std::string sha256;
    std::string crc32;
    std::string kind;
};

/* Current UTC time in ISO-8601 format. */
inline std::string iso_utc_now() {
    using namespace std::chrono;
    auto now = system_clock::now();
    std::time_t t = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::ostringstream os;
    os << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return os.str();
}

/* Random hex string for IDs (not cryptographically secure). */
inline std::string rand_id() {
    std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<unsigned long long> d;
    std::ostringstream os;
    os << std::hex << d(rng) << d(rng);
    return os.str();
}

/* Minimal JSON string escaper: quotes, backslashes, and control chars. */
inline std::string jesc(const std::string& s) {
    std::string o; o.reserve(s.size()+8);
    for (char c: s) {
        switch(c){
            case '\"': o += "\\\""; break;
            case '\\': o += "\\\\"; break;
            case '\n': o += "\\n"; break;
            case '\r': o += "\\r"; break;
            case '\t': o += "\\t"; break;
            default: o += (unsigned char)c < 0x20 ? '?' : c;
        }
    }
    return o;
}

/* Write text to a file (binary mode), creating parent directories. */
inline bool write_text_file(const std::filesystem::path& p, const std::string& txt) {
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    std::ofstream f(p, std::ios::binary);
    f << txt;
    return static_cast<bool>(f);
}

/* Describe a file on disk: size, SHA-256 and CRC-32. Empty digests if unreadable. */
inline Artifact describe_file(const std::filesystem::path& p, const std::string& kind) {
    Artifact a;
    a.path = p.string();
    a.kind = kind;

    std::ifstream f(p, std::ios::binary);
    if (!f) return a;

    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) return a;
    EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr);

    std::vector<unsigned char> buf(1<<20);
    uLong crc = crc32(0L, Z_NULL, 0);
    while (f) {
        f.read(reinterpret_cast<char*>(buf.data()), static_cast<std::streamsize>(buf.size()));
        std::streamsize got = f.gcount();
        if (got <= 0) break;
        EVP_DigestUpdate(ctx, buf.data(), static_cast<size_t>(got));
        crc = crc32(crc, buf.data(), static_cast<uInt>(got));
        a.size += static_cast<std::uintmax_t>(got);
    }

    unsigned char out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    EVP_DigestFinal_ex(ctx, out, &outLen);
    EVP_MD_CTX_free(ctx);

    std::ostringstream sh;
    sh << std::hex << std::setfill('0');
    for (unsigned int i = 0; i < outLen; ++i) sh << std::setw(2) << static_cast<int>(out[i]);
    a.sha256 = sh.str();

    std::ostringstream cs;
    cs << std::hex << std::uppercase << std::setfill('0') << std::setw(8) << static_cast<std::uint32_t>(crc);
    a.crc32 = cs.str();
    return a;
}

/* "runs/<mode>_<UTC timestamp>_<random id>" */
inline std::string default_outdir(const std::string& mode) {
    auto stamp = iso_utc_now();
    for (auto& c: stamp) if (c==':'||c=='-') c = '_';
    return std::string("runs/") + mode + "_" + stamp + "_" + rand_id();
}

/* Join argv arguments into a single command-line string. */
inline std::string join_argv(int argc, char** argv) {
    std::ostringstream os;
    for (int i=0;i<argc;++i) {
        if (i) os<<' ';
        os<<argv[i];
    }
    return os.str();
}

/* JSON array body for a list of artifacts. */
inline std::string artifacts_json(const std::vector<Artifact>& arts, const std::string& indent) {
    std::ostringstream j;
    for (std::size_t i = 0; i < arts.size(); ++i) {
        const auto& a = arts[i];
        j << indent << "{\"path\":\"" << jesc(a.path) << "\","
          << "\"size\":" << a.size << ","
          << "\"sha256\":\"" << a.sha256 << "\","
          << "\"crc32\":\"" << a.crc32 << "\","
          << "\"kind\":\"" << jesc(a.kind) << "\"}"
          << (i + 1 < arts.size() ? ",\n" : "\n");
    }
    return j.str();
}

} // namespace mist
