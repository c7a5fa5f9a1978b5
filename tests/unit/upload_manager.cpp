#include <algorithm>
#include <cassert>
#include <cctype>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <asio/io_context.hpp>

#include "chunkvault/crypto.hpp"
#include "chunkvault/server/blob_store.hpp"
#include "chunkvault/server/chunk_store.hpp"
#include "chunkvault/server/content_index.hpp"
#include "chunkvault/server/expiry_sweeper.hpp"
#include "chunkvault/server/session_registry.hpp"
#include "chunkvault/server/upload_error.hpp"
#include "chunkvault/server/upload_manager.hpp"

using namespace chunkvault;
using namespace chunkvault::server;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    // Wires the filesystem backends under a scratch directory with a controllable clock.
    struct Harness
    {
        explicit Harness(const std::string &name, UploadConfig config = {})
            : root(prepare(name)), sessions(root), chunks(root), index(root), blobs(root),
              uploads(std::move(config), UploadServices{sessions, chunks, index, blobs}, [this]
                      { return now; })
        {
        }

        ~Harness()
        {
            uploads.wait_for_background_tasks();
            cleanup_path(root);
        }

        static std::filesystem::path prepare(const std::string &name)
        {
            const auto path = std::filesystem::temp_directory_path() / name;
            cleanup_path(path);
            std::filesystem::create_directories(path);
            return path;
        }

        std::size_t stored_files() const
        {
            std::size_t count = 0;
            for (const auto &entry : std::filesystem::directory_iterator(root / "files"))
            {
                if (entry.is_regular_file())
                {
                    ++count;
                }
            }
            return count;
        }

        std::size_t staged_files() const
        {
            std::size_t count = 0;
            for (const auto &entry : std::filesystem::directory_iterator(root / ".chunkvault" / "staging"))
            {
                (void)entry;
                ++count;
            }
            return count;
        }

        TimePoint now{std::chrono::system_clock::now()};
        std::filesystem::path root;
        JsonSessionRegistry sessions;
        FilesystemChunkStore chunks;
        JsonContentIndex index;
        FilesystemBlobStore blobs;
        UploadManager uploads;
    };

    std::vector<std::byte> pattern(std::size_t size, std::uint32_t seed)
    {
        std::vector<std::byte> data(size);
        std::uint32_t state = seed;
        for (auto &byte : data)
        {
            state = state * 1664525u + 1013904223u;
            byte = static_cast<std::byte>(state >> 24);
        }
        return data;
    }

    std::span<const std::byte> chunk_of(const std::vector<std::byte> &data, std::uint64_t chunk_size,
                                        std::uint32_t index)
    {
        const auto offset = static_cast<std::size_t>(index * chunk_size);
        const auto length = std::min<std::size_t>(chunk_size, data.size() - offset);
        return std::span<const std::byte>(data).subspan(offset, length);
    }

    void upload_all(UploadManager &uploads, const std::string &session_id, const std::vector<std::byte> &data,
                    std::uint64_t chunk_size)
    {
        const auto total = static_cast<std::uint32_t>((data.size() + chunk_size - 1) / chunk_size);
        for (std::uint32_t i = 0; i < total; ++i)
        {
            uploads.upload_chunk(session_id, i, chunk_of(data, chunk_size, i));
        }
    }

    template <typename Fn>
    std::optional<ErrorCode> error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const UploadError &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    std::string read_all(BlobStore &blobs, const std::string &locator)
    {
        auto in = blobs.open(locator);
        std::ostringstream contents;
        contents << in->rdbuf();
        return contents.str();
    }

    // Holds every create() until release(), so a merge can be parked mid-flight.
    class GatedBlobStore final : public BlobStore
    {
    public:
        explicit GatedBlobStore(BlobStore &inner) : inner_(inner) {}

        std::unique_ptr<BlobWriter> create(const std::string &file_name) override
        {
            {
                std::unique_lock lock(mutex_);
                entered_ = true;
                cv_.notify_all();
                cv_.wait(lock, [this]
                         { return released_; });
            }
            return inner_.create(file_name);
        }

        bool exists(const std::string &locator) const override { return inner_.exists(locator); }

        std::unique_ptr<std::istream> open(const std::string &locator) const override
        {
            return inner_.open(locator);
        }

        void remove(const std::string &locator) override { inner_.remove(locator); }

        void wait_until_entered()
        {
            std::unique_lock lock(mutex_);
            cv_.wait(lock, [this]
                     { return entered_; });
        }

        void release()
        {
            std::lock_guard lock(mutex_);
            released_ = true;
            cv_.notify_all();
        }

    private:
        BlobStore &inner_;
        std::mutex mutex_;
        std::condition_variable cv_;
        bool entered_{false};
        bool released_{false};
    };

    // Misses the first digest lookup, as if another merge committed right after it.
    class LateLookupIndex final : public ContentIndex
    {
    public:
        explicit LateLookupIndex(ContentIndex &inner) : inner_(inner) {}

        std::optional<FinalizedFile> find_by_digest(const std::string &digest) const override
        {
            if (misses_left_ > 0)
            {
                --misses_left_;
                return std::nullopt;
            }
            return inner_.find_by_digest(digest);
        }

        std::optional<FinalizedFile> find_by_id(const std::string &file_id) const override
        {
            return inner_.find_by_id(file_id);
        }

        InsertResult insert_if_absent(const FinalizedFile &file) override { return inner_.insert_if_absent(file); }

        std::size_t size() const override { return inner_.size(); }

    private:
        ContentIndex &inner_;
        mutable int misses_left_{1};
    };

    void test_init_validation()
    {
        UploadConfig config;
        config.max_file_size = 10'000;
        config.allowed_extensions = {".bin", "TXT"};
        Harness h("chunkvault_init_validation", config);

        const auto invalid = [&](InitRequest request)
        {
            return error_of([&]
                            { h.uploads.init(request); }) == ErrorCode::InvalidArgument;
        };
        assert(invalid({.file_name = "", .total_size = 10}));
        assert(invalid({.file_name = "../a.bin", .total_size = 10}));
        assert(invalid({.file_name = "dir\\a.bin", .total_size = 10}));
        assert(invalid({.file_name = "..", .total_size = 10}));
        assert(invalid({.file_name = "a.bin", .total_size = 0}));
        assert(invalid({.file_name = "a.bin", .total_size = 10'001}));
        assert(invalid({.file_name = "a.exe", .total_size = 10}));
        assert(invalid({.file_name = "a.bin", .total_size = 10, .chunk_size = 512}));
        assert(invalid({.file_name = "a.bin", .total_size = 10, .chunk_size = 11ULL * 1024 * 1024}));
        assert(invalid({.file_name = "a.bin", .total_size = 10, .declared_digest = std::string("abc")}));
        assert(h.sessions.list().empty());

        // Extensions match case-insensitively; chunk size 0 picks the default.
        const auto result = h.uploads.init({.file_name = "NOTES.TXT", .total_size = 10'000});
        assert(result.chunk_size == config.chunk_size);
        assert(result.total_chunks == 1);
        assert(result.expires_at == h.now + config.retention);

        // Init twice creates independent sessions.
        const auto again = h.uploads.init({.file_name = "NOTES.TXT", .total_size = 10'000});
        assert(again.session_id != result.session_id);
        assert(h.sessions.list().size() == 2);
    }

    void test_boundary_chunking()
    {
        Harness h("chunkvault_boundary");
        const auto init = h.uploads.init({.file_name = "b.bin", .total_size = 1025, .chunk_size = 1024});
        assert(init.total_chunks == 2);
        assert(init.chunk_size == 1024);

        const auto data = pattern(1025, 7);
        assert(error_of([&]
                        { h.uploads.upload_chunk(init.session_id, 1, chunk_of(data, 1024, 0)); }) ==
               ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { h.uploads.upload_chunk(init.session_id, 2, chunk_of(data, 1024, 1)); }) ==
               ErrorCode::InvalidArgument);
        assert(!h.chunks.exists(init.session_id, 1));

        h.uploads.upload_chunk(init.session_id, 0, chunk_of(data, 1024, 0));
        const auto last = h.uploads.upload_chunk(init.session_id, 1, chunk_of(data, 1024, 1));
        assert(last.status == SessionStatus::Completed);

        const auto records = h.sessions.chunks(init.session_id);
        assert(records.size() == 2);
        assert(records[0].size == 1024);
        assert(records[1].size == 1);
    }

    void test_out_of_order_merge()
    {
        Harness h("chunkvault_five_million");
        const std::uint64_t chunk_size = 2'000'000;
        const auto data = pattern(5'000'000, 42);

        const auto init = h.uploads.init({.file_name = "a.bin", .total_size = data.size(), .chunk_size = chunk_size});
        assert(init.total_chunks == 3);
        assert(h.sessions.find(init.session_id)->status == SessionStatus::Initialized);

        auto result = h.uploads.upload_chunk(init.session_id, 1, chunk_of(data, chunk_size, 1));
        assert(result.status == SessionStatus::Uploading);
        assert(result.uploaded_chunk_count == 1);
        assert(!result.already_present);

        auto report = h.uploads.status(init.session_id);
        assert(report.uploaded == std::vector<std::uint32_t>{1});
        assert((report.missing == std::vector<std::uint32_t>{0, 2}));

        result = h.uploads.upload_chunk(init.session_id, 0, chunk_of(data, chunk_size, 0));
        assert(result.status == SessionStatus::Uploading);

        const auto tail = chunk_of(data, chunk_size, 2);
        assert(tail.size() == 1'000'000);
        result = h.uploads.upload_chunk(init.session_id, 2, tail, crypto::hash_bytes(tail));
        assert(result.status == SessionStatus::Completed);
        assert(result.uploaded_chunk_count == 3);
        assert(result.progress_percent == 100.0);
        assert(h.sessions.find(init.session_id)->completed_at);

        const auto merged = h.uploads.merge(init.session_id);
        assert(!merged.deduplicated);
        assert(merged.file.size == 5'000'000);
        assert(merged.file.digest == crypto::hash_bytes(data));

        const auto contents = read_all(h.blobs, merged.file.locator);
        assert(contents.size() == data.size());
        assert(std::equal(contents.begin(), contents.end(), data.begin(), [](char a, std::byte b)
                          { return static_cast<std::byte>(a) == b; }));

        h.uploads.wait_for_background_tasks();
        assert(!h.chunks.exists(init.session_id, 0));
        assert(h.chunks.sessions().empty());
        assert(h.staged_files() == 0);

        const auto after = h.uploads.status(init.session_id);
        assert(after.session.status == SessionStatus::Merged);
        assert(after.session.finalized_file_id == merged.file.file_id);
        assert(after.missing.empty());
        assert(after.progress_percent == 100.0);

        assert(h.uploads.finalized_file(merged.file.file_id).digest == merged.file.digest);
        assert(error_of([&]
                        { h.uploads.merge(init.session_id); }) == ErrorCode::StateConflict);
        assert(error_of([&]
                        { h.uploads.upload_chunk(init.session_id, 0, chunk_of(data, chunk_size, 0)); }) ==
               ErrorCode::StateConflict);
    }

    void test_reupload_is_idempotent()
    {
        Harness h("chunkvault_idempotent");
        const auto data = pattern(3000, 3);
        const auto init = h.uploads.init({.file_name = "c.bin", .total_size = data.size(), .chunk_size = 1024});

        const auto first = h.uploads.upload_chunk(init.session_id, 1, chunk_of(data, 1024, 1));
        const auto before = h.sessions.find_chunk(init.session_id, 1);
        const auto second = h.uploads.upload_chunk(init.session_id, 1, chunk_of(data, 1024, 1));

        assert(!first.already_present);
        assert(second.already_present);
        assert(second.uploaded_chunk_count == first.uploaded_chunk_count);
        assert(second.status == first.status);
        assert(h.sessions.chunks(init.session_id).size() == 1);
        assert(h.sessions.find_chunk(init.session_id, 1)->digest == before->digest);
        assert(h.sessions.find(init.session_id)->uploaded_chunk_count == 1);
    }

    void test_chunk_digest_verification()
    {
        {
            Harness h("chunkvault_chunk_digest");
            const auto data = pattern(2048, 9);
            const auto init = h.uploads.init({.file_name = "d.bin", .total_size = data.size(), .chunk_size = 1024});

            const auto wrong = crypto::hash_bytes(chunk_of(data, 1024, 1));
            assert(error_of([&]
                            { h.uploads.upload_chunk(init.session_id, 0, chunk_of(data, 1024, 0), wrong); }) ==
                   ErrorCode::IntegrityError);
            assert(!h.chunks.exists(init.session_id, 0));
            assert(h.sessions.find(init.session_id)->uploaded_chunk_count == 0);

            auto upper = crypto::hash_bytes(chunk_of(data, 1024, 0));
            std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char ch)
                           { return static_cast<char>(std::toupper(ch)); });
            const auto accepted = h.uploads.upload_chunk(init.session_id, 0, chunk_of(data, 1024, 0), upper);
            assert(accepted.uploaded_chunk_count == 1);
        }
        {
            UploadConfig config;
            config.enable_digest_check = false;
            Harness h("chunkvault_chunk_digest_off", config);
            const auto data = pattern(1024, 9);
            const auto init = h.uploads.init({.file_name = "d.bin", .total_size = data.size(), .chunk_size = 1024});
            const auto result = h.uploads.upload_chunk(init.session_id, 0, data, std::string(64, '0'));
            assert(result.status == SessionStatus::Completed);
        }
    }

    void test_validate_chunk()
    {
        Harness h("chunkvault_validate");
        const auto data = pattern(2048, 11);
        const auto init = h.uploads.init({.file_name = "v.bin", .total_size = data.size(), .chunk_size = 1024});
        h.uploads.upload_chunk(init.session_id, 0, chunk_of(data, 1024, 0));

        assert(h.uploads.validate_chunk(init.session_id, 0, crypto::hash_bytes(chunk_of(data, 1024, 0))));
        assert(!h.uploads.validate_chunk(init.session_id, 0, crypto::hash_bytes(chunk_of(data, 1024, 1))));
        assert(!h.uploads.validate_chunk(init.session_id, 1, crypto::hash_bytes(chunk_of(data, 1024, 1))));
        assert(error_of([&]
                        { (void)h.uploads.validate_chunk(init.session_id, 5, "00"); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { (void)h.uploads.validate_chunk("unknown", 0, "00"); }) == ErrorCode::NotFound);
        assert(h.uploads.uploaded_chunks(init.session_id) == std::vector<std::uint32_t>{0});
    }

    void test_merge_requires_completed()
    {
        Harness h("chunkvault_merge_uploading");
        const auto data = pattern(4096, 5);
        const auto init = h.uploads.init({.file_name = "e.bin", .total_size = data.size(), .chunk_size = 1024});
        h.uploads.upload_chunk(init.session_id, 2, chunk_of(data, 1024, 2));

        assert(error_of([&]
                        { h.uploads.merge(init.session_id); }) == ErrorCode::StateConflict);
        assert(h.stored_files() == 0);
        assert(h.staged_files() == 0);
        assert(h.index.size() == 0);
        assert(h.sessions.find(init.session_id)->status == SessionStatus::Uploading);
        assert(h.chunks.exists(init.session_id, 2));

        assert(error_of([&]
                        { h.uploads.merge("unknown"); }) == ErrorCode::NotFound);
    }

    void test_merge_digest_mismatch()
    {
        Harness h("chunkvault_merge_digest");
        const auto data = pattern(3000, 13);
        const auto declared = crypto::hash_bytes(data);
        const auto init = h.uploads.init(
            {.file_name = "f.bin", .total_size = data.size(), .chunk_size = 1024, .declared_digest = declared});
        upload_all(h.uploads, init.session_id, data, 1024);

        const auto other = crypto::hash_bytes(pattern(10, 1));
        assert(error_of([&]
                        { h.uploads.merge(init.session_id, other); }) == ErrorCode::IntegrityError);
        assert(h.sessions.find(init.session_id)->status == SessionStatus::Completed);
        assert(h.stored_files() == 0);
        assert(h.staged_files() == 0);
        assert(h.chunks.exists(init.session_id, 0));

        // Falls back to the digest declared at init.
        const auto merged = h.uploads.merge(init.session_id);
        assert(merged.file.digest == declared);
        assert(h.stored_files() == 1);
    }

    void test_deduplication()
    {
        Harness h("chunkvault_dedup");
        const auto data = pattern(2500, 21);

        const auto first = h.uploads.init({.file_name = "one.bin", .total_size = data.size(), .chunk_size = 1024});
        upload_all(h.uploads, first.session_id, data, 1024);
        const auto merged_first = h.uploads.merge(first.session_id);
        assert(!merged_first.deduplicated);

        const auto second = h.uploads.init({.file_name = "two.bin", .total_size = data.size(), .chunk_size = 2048});
        upload_all(h.uploads, second.session_id, data, 2048);
        const auto merged_second = h.uploads.merge(second.session_id);
        assert(merged_second.deduplicated);
        assert(merged_second.file.file_id == merged_first.file.file_id);
        assert(merged_second.file.locator == merged_first.file.locator);

        h.uploads.wait_for_background_tasks();
        assert(h.index.size() == 1);
        assert(h.stored_files() == 1);
        assert(h.staged_files() == 0);
        assert(h.sessions.find(second.session_id)->finalized_file_id == merged_first.file.file_id);
    }

    void test_cancel()
    {
        Harness h("chunkvault_cancel");
        const auto data = pattern(2048, 17);
        const auto init = h.uploads.init({.file_name = "g.bin", .total_size = data.size(), .chunk_size = 1024});
        h.uploads.upload_chunk(init.session_id, 0, chunk_of(data, 1024, 0));

        assert(h.uploads.cancel(init.session_id));
        assert(!h.chunks.exists(init.session_id, 0));
        assert(!h.sessions.find(init.session_id));
        assert(error_of([&]
                        { (void)h.uploads.status(init.session_id); }) == ErrorCode::NotFound);
        assert(error_of([&]
                        { h.uploads.upload_chunk(init.session_id, 1, chunk_of(data, 1024, 1)); }) ==
               ErrorCode::NotFound);

        assert(!h.uploads.cancel(init.session_id));
        assert(!h.uploads.cancel("never-existed"));
    }

    void test_expiry()
    {
        Harness h("chunkvault_expiry");
        const auto data = pattern(2048, 19);
        const auto stale = h.uploads.init({.file_name = "h.bin", .total_size = data.size(), .chunk_size = 1024});
        const auto late = h.uploads.init({.file_name = "i.bin", .total_size = data.size(), .chunk_size = 1024});
        h.uploads.upload_chunk(stale.session_id, 0, chunk_of(data, 1024, 0));
        h.uploads.upload_chunk(late.session_id, 0, chunk_of(data, 1024, 0));

        h.now += std::chrono::hours(25);
        const auto fresh = h.uploads.init({.file_name = "j.bin", .total_size = data.size(), .chunk_size = 1024});

        assert(h.uploads.status(stale.session_id).session.status == SessionStatus::Expired);
        assert(error_of([&]
                        { h.uploads.upload_chunk(late.session_id, 1, chunk_of(data, 1024, 1)); }) ==
               ErrorCode::Expired);
        assert(h.sessions.find(late.session_id)->status == SessionStatus::Expired);
        assert(error_of([&]
                        { h.uploads.upload_chunk(late.session_id, 1, chunk_of(data, 1024, 1)); }) ==
               ErrorCode::StateConflict);

        assert(h.uploads.cleanup_expired() == 2);
        assert(!h.sessions.find(stale.session_id));
        assert(!h.sessions.find(late.session_id));
        assert(!h.chunks.exists(stale.session_id, 0));
        assert(error_of([&]
                        { (void)h.chunks.read(stale.session_id, 0); }) == ErrorCode::NotFound);
        assert(h.sessions.find(fresh.session_id));

        // Re-running finds nothing left to do.
        assert(h.uploads.cleanup_expired() == 0);
    }

    void test_orphan_collection()
    {
        Harness h("chunkvault_orphans");
        const auto data = pattern(1024, 23);
        h.chunks.write("orphan", 0, data);
        const auto live = h.uploads.init({.file_name = "k.bin", .total_size = 2048, .chunk_size = 1024});
        h.uploads.upload_chunk(live.session_id, 0, data);

        assert(h.uploads.cleanup_expired() == 0);
        const auto remaining = h.chunks.sessions();
        assert(remaining.size() == 1);
        assert(remaining.front() == live.session_id);
    }

    void test_concurrent_chunk_uploads()
    {
        Harness h("chunkvault_concurrent");
        const std::uint64_t chunk_size = 1024;
        const auto data = pattern(64 * chunk_size + 100, 29);
        const auto init = h.uploads.init({.file_name = "l.bin", .total_size = data.size(), .chunk_size = chunk_size});
        assert(init.total_chunks == 65);

        std::vector<std::thread> workers;
        for (std::uint32_t worker = 0; worker < 4; ++worker)
        {
            workers.emplace_back([&, worker]
                                 {
                                     // Every worker sends every chunk; only one record per index may win.
                                     for (std::uint32_t i = 0; i < init.total_chunks; ++i)
                                     {
                                         const auto index = (i + worker * 16) % init.total_chunks;
                                         h.uploads.upload_chunk(init.session_id, index, chunk_of(data, chunk_size, index));
                                     } });
        }
        for (auto &worker : workers)
        {
            worker.join();
        }

        const auto session = h.sessions.find(init.session_id);
        assert(session->uploaded_chunk_count == init.total_chunks);
        assert(session->status == SessionStatus::Completed);
        assert(h.sessions.chunks(init.session_id).size() == init.total_chunks);

        const auto merged = h.uploads.merge(init.session_id);
        assert(merged.file.digest == crypto::hash_bytes(data));
    }

    void test_plan_and_file_lookup()
    {
        Harness h("chunkvault_plan");
        const auto plan = h.uploads.plan(5'000'000, 2'000'000);
        assert(plan.total_chunks == 3);
        assert(plan.last_chunk_size == 1'000'000);

        const auto defaulted = h.uploads.plan(10, 0);
        assert(defaulted.chunk_size == h.uploads.config().chunk_size);
        assert(defaulted.total_chunks == 1);

        assert(error_of([&]
                        { (void)h.uploads.plan(0, 1024); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { (void)h.uploads.finalized_file("missing"); }) == ErrorCode::NotFound);
    }

    void test_expiry_sweeper()
    {
        Harness h("chunkvault_sweeper");
        const auto init = h.uploads.init({.file_name = "m.bin", .total_size = 2048, .chunk_size = 1024});
        h.now += std::chrono::hours(48);

        asio::io_context io_context;
        ExpirySweeper sweeper(io_context, h.uploads, std::chrono::hours(1));
        sweeper.start();
        assert(sweeper.running());
        io_context.run_for(std::chrono::milliseconds(200));
        assert(sweeper.passes() == 1);
        assert(!h.sessions.find(init.session_id));

        sweeper.stop();
        assert(!sweeper.running());
        io_context.restart();
        io_context.run();

        assert(sweeper.sweep_once() == 0);
        assert(sweeper.passes() == 2);
    }

    void test_retry_completes_interrupted_session()
    {
        const auto root = Harness::prepare("chunkvault_interrupted");
        const auto data = pattern(1025, 31);
        std::string retried_id;
        std::string restarted_id;

        // Stores chunk 1 and its record the way upload_chunk does, then stops before the status update.
        const auto store_without_progress = [&](JsonSessionRegistry &sessions, FilesystemChunkStore &chunks,
                                                const std::string &session_id)
        {
            ChunkRecord record{};
            record.session_id = session_id;
            record.index = 1;
            record.size = 1;
            record.digest = crypto::hash_bytes(chunk_of(data, 1024, 1));
            record.locator = chunks.write(session_id, 1, chunk_of(data, 1024, 1));
            record.uploaded_at = std::chrono::system_clock::now();
            assert(sessions.insert_chunk(record));
            assert(sessions.find(session_id)->status == SessionStatus::Uploading);
            assert(sessions.find(session_id)->uploaded_chunk_count == 2);
        };

        {
            JsonSessionRegistry sessions(root);
            FilesystemChunkStore chunks(root);
            JsonContentIndex index(root);
            FilesystemBlobStore blobs(root);
            UploadManager uploads(UploadConfig{}, UploadServices{sessions, chunks, index, blobs});

            retried_id = uploads.init({.file_name = "n.bin", .total_size = data.size(), .chunk_size = 1024}).session_id;
            restarted_id = uploads.init({.file_name = "o.bin", .total_size = data.size(), .chunk_size = 1024}).session_id;
            for (const auto &session_id : {retried_id, restarted_id})
            {
                uploads.upload_chunk(session_id, 0, chunk_of(data, 1024, 0));
                store_without_progress(sessions, chunks, session_id);
            }

            const auto retried = uploads.upload_chunk(retried_id, 1, chunk_of(data, 1024, 1));
            assert(retried.already_present);
            assert(retried.status == SessionStatus::Completed);
            assert(retried.uploaded_chunk_count == 2);
            assert(uploads.merge(retried_id).file.digest == crypto::hash_bytes(data));
        }

        {
            JsonSessionRegistry sessions(root);
            FilesystemChunkStore chunks(root);
            JsonContentIndex index(root);
            FilesystemBlobStore blobs(root);
            UploadManager uploads(UploadConfig{}, UploadServices{sessions, chunks, index, blobs});

            const auto restored = sessions.find(restarted_id);
            assert(restored->status == SessionStatus::Completed);
            assert(restored->completed_at);

            const auto retried = uploads.upload_chunk(restarted_id, 1, chunk_of(data, 1024, 1));
            assert(retried.already_present);
            assert(retried.status == SessionStatus::Completed);

            const auto merged = uploads.merge(restarted_id);
            assert(merged.deduplicated);
            assert(merged.file.digest == crypto::hash_bytes(data));
        }

        // The restored status was written back.
        {
            JsonSessionRegistry sessions(root);
            assert(sessions.find(restarted_id)->status == SessionStatus::Merged);
        }
        cleanup_path(root);
    }

    void test_expiry_waits_for_running_merge()
    {
        Harness h("chunkvault_expiry_during_merge");
        GatedBlobStore gated(h.blobs);
        UploadManager uploads(UploadConfig{}, UploadServices{h.sessions, h.chunks, h.index, gated}, [&h]
                              { return h.now; });

        const auto data = pattern(2048, 41);
        const auto init = uploads.init({.file_name = "p.bin", .total_size = data.size(), .chunk_size = 1024});
        upload_all(uploads, init.session_id, data, 1024);

        std::optional<MergeResult> merged;
        std::thread merger([&]
                           { merged = uploads.merge(init.session_id); });
        gated.wait_until_entered();

        // The deadline passes while the merge is assembling.
        h.now += std::chrono::hours(25);
        assert(error_of([&]
                        { uploads.upload_chunk(init.session_id, 0, chunk_of(data, 1024, 0)); }) ==
               ErrorCode::Expired);
        assert(h.sessions.find(init.session_id)->status == SessionStatus::Completed);

        gated.release();
        merger.join();

        assert(merged);
        assert(!merged->deduplicated);
        assert(h.sessions.find(init.session_id)->status == SessionStatus::Merged);
        assert(uploads.finalized_file(merged->file.file_id).locator == merged->file.locator);

        uploads.wait_for_background_tasks();
        assert(uploads.cleanup_expired() == 0);
        assert(h.sessions.find(init.session_id));
        assert(h.stored_files() == 1);
    }

    void test_dedup_race_keeps_single_copy()
    {
        Harness h("chunkvault_dedup_race");
        const auto data = pattern(3000, 37);

        const auto first = h.uploads.init({.file_name = "q.bin", .total_size = data.size(), .chunk_size = 1024});
        upload_all(h.uploads, first.session_id, data, 1024);
        const auto winner = h.uploads.merge(first.session_id);
        assert(!winner.deduplicated);

        LateLookupIndex late(h.index);
        UploadManager uploads(UploadConfig{}, UploadServices{h.sessions, h.chunks, late, h.blobs}, [&h]
                              { return h.now; });
        const auto second = uploads.init({.file_name = "r.bin", .total_size = data.size(), .chunk_size = 1024});
        upload_all(uploads, second.session_id, data, 1024);

        const auto loser = uploads.merge(second.session_id);
        assert(loser.deduplicated);
        assert(loser.file.file_id == winner.file.file_id);
        assert(loser.file.locator == winner.file.locator);

        uploads.wait_for_background_tasks();
        h.uploads.wait_for_background_tasks();
        assert(h.stored_files() == 1);
        assert(h.staged_files() == 0);
        assert(h.index.size() == 1);
        assert(h.blobs.exists(winner.file.locator));
        assert(h.sessions.find(second.session_id)->finalized_file_id == winner.file.file_id);
    }

    void test_merge_with_missing_chunk_file()
    {
        Harness h("chunkvault_missing_chunk");
        const auto data = pattern(2048, 43);
        const auto init = h.uploads.init({.file_name = "s.bin", .total_size = data.size(), .chunk_size = 1024});
        upload_all(h.uploads, init.session_id, data, 1024);

        std::filesystem::remove(h.chunks.chunk_path(init.session_id, 1));
        assert(error_of([&]
                        { h.uploads.merge(init.session_id); }) == ErrorCode::IntegrityError);
        assert(h.sessions.find(init.session_id)->status == SessionStatus::Completed);
        assert(h.stored_files() == 0);
        assert(h.staged_files() == 0);
        assert(!h.uploads.validate_chunk(init.session_id, 1, crypto::hash_bytes(chunk_of(data, 1024, 1))));
    }

} // namespace

void run_upload_manager_tests()
{
    test_init_validation();
    test_boundary_chunking();
    test_out_of_order_merge();
    test_reupload_is_idempotent();
    test_chunk_digest_verification();
    test_validate_chunk();
    test_merge_requires_completed();
    test_merge_digest_mismatch();
    test_deduplication();
    test_cancel();
    test_expiry();
    test_orphan_collection();
    test_concurrent_chunk_uploads();
    test_plan_and_file_lookup();
    test_expiry_sweeper();
    test_retry_completes_interrupted_session();
    test_expiry_waits_for_running_merge();
    test_dedup_race_keeps_single_copy();
    test_merge_with_missing_chunk_file();
}
