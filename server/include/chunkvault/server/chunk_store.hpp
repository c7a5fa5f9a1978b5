#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <string>
#include <vector>

namespace chunkvault::server
{

    /// Durable byte storage for individual chunks, addressed by (session id, index).
    ///
    /// Implementations must make a chunk visible only once it is completely written,
    /// and must never replace a chunk that already exists.
    class ChunkStore
    {
    public:
        using ChunkSink = std::function<void(std::span<const std::byte>)>;

        virtual ~ChunkStore() = default;

        /// Stores the chunk unless one already exists for the same key; returns its locator.
        virtual std::string write(const std::string &session_id, std::uint32_t index,
                                  std::span<const std::byte> data) = 0;

        virtual bool exists(const std::string &session_id, std::uint32_t index) const = 0;

        virtual std::vector<std::byte> read(const std::string &session_id, std::uint32_t index) const = 0;

        /// Streams the chunk into `sink` in bounded pieces; returns the number of bytes read.
        virtual std::uint64_t read_into(const std::string &session_id, std::uint32_t index,
                                        const ChunkSink &sink) const = 0;

        /// Deletes every chunk of the session. Deleting an unknown session is a no-op.
        virtual void remove_session(const std::string &session_id) = 0;

        /// Ids of all sessions that currently have stored chunks.
        virtual std::vector<std::string> sessions() const = 0;
    };

    // Layout: <root>/.chunkvault/chunks/<session id>/chunk_<index, 6 digits>
    class FilesystemChunkStore final : public ChunkStore
    {
    public:
        explicit FilesystemChunkStore(std::filesystem::path storage_root);

        std::string write(const std::string &session_id, std::uint32_t index,
                          std::span<const std::byte> data) override;

        bool exists(const std::string &session_id, std::uint32_t index) const override;

        std::vector<std::byte> read(const std::string &session_id, std::uint32_t index) const override;

        std::uint64_t read_into(const std::string &session_id, std::uint32_t index,
                                const ChunkSink &sink) const override;

        void remove_session(const std::string &session_id) override;

        std::vector<std::string> sessions() const override;

        std::filesystem::path chunk_path(const std::string &session_id, std::uint32_t index) const;

    private:
        std::filesystem::path session_dir(const std::string &session_id) const;
        std::string locator_for(const std::string &session_id, std::uint32_t index) const;

        std::filesystem::path chunks_dir_;
    };

} // namespace chunkvault::server
