// ============================================================================
//  File: include/pxld/byte_source.hpp — Sources d’octets en lecture seule
//  Project: PXLD v3 LED frame container
//
//  • ByteSource : lecture positionnée (offset explicite), sans curseur partagé.
//    Plusieurs threads peuvent lire la même source en parallèle.
//  • MemorySource : buffer possédé (tests, fichiers déjà chargés).
//  • FileSource   : descripteur POSIX + pread, fermeture RAII.
// ============================================================================

#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "pxld/format.hpp"

namespace pxld
{

class ByteSource
{
public:
    virtual ~ByteSource() = default;

    virtual uint64_t size() const = 0;

    // Lit exactement n octets à `offset`. false si la plage dépasse EOF ou
    // en cas d’erreur d’E/S (err renseigné).
    virtual bool read_at(uint64_t offset, void* dst, size_t n, PxldError* err = nullptr) const = 0;
};

class MemorySource : public ByteSource
{
public:
    MemorySource() = default;
    explicit MemorySource(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

    uint64_t size() const override { return bytes_.size(); }
    bool read_at(uint64_t offset, void* dst, size_t n, PxldError* err = nullptr) const override;

    const std::vector<uint8_t>& bytes() const { return bytes_; }

private:
    std::vector<uint8_t> bytes_;
};

class FileSource : public ByteSource
{
public:
    FileSource() = default;
    ~FileSource() override;
    FileSource(const FileSource&) = delete;
    FileSource& operator=(const FileSource&) = delete;

    bool open(const std::string& path, PxldError* err = nullptr);
    void close();
    bool is_open() const { return fd_>=0; }
    const std::string& path() const { return path_; }

    uint64_t size() const override { return size_; }
    bool read_at(uint64_t offset, void* dst, size_t n, PxldError* err = nullptr) const override;

private:
    int fd_ = -1;
    uint64_t size_ = 0;
    std::string path_;
};

// Charge un fichier entier en mémoire (outils, tests).
bool read_whole_file(const std::string& path, std::vector<uint8_t>& out, PxldError* err = nullptr);

} // namespace pxld
