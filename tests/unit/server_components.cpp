#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <numeric>
#include <optional>
#include <random>
#include <set>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "vaultdrop/crypto.hpp"
#include "vaultdrop/error_codes.hpp"
#include "vaultdrop/file_lock.hpp"
#include "vaultdrop/server/chunk_store.hpp"
#include "vaultdrop/server/config.hpp"
#include "vaultdrop/server/file_store.hpp"
#include "vaultdrop/server/progress.hpp"
#include "vaultdrop/server/progress_mirror.hpp"
#include "vaultdrop/server/session_registry.hpp"
#include "vaultdrop/server/upload_manager.hpp"

using namespace vaultdrop;
using namespace vaultdrop::server;

namespace
{
    constexpr std::uint64_t kMiB = 1024 * 1024;

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_dir(const std::string &name)
    {
        const auto path = std::filesystem::temp_directory_path() / name;
        cleanup_path(path);
        std::filesystem::create_directories(path);
        return path;
    }

    template <typename Fn>
    ErrorCode error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const OperationError &error)
        {
            return error.code();
        }
        return ErrorCode::Ok;
    }

    // Deterministic bytes that zlib cannot shrink.
    std::vector<std::byte> noise(std::size_t size, std::uint32_t seed)
    {
        std::mt19937 rng(seed);
        std::vector<std::byte> bytes(size);
        for (auto &byte : bytes)
        {
            byte = static_cast<std::byte>(rng() & 0xFFu);
        }
        return bytes;
    }

    std::vector<std::byte> text_bytes(std::size_t size)
    {
        const std::string line = "2024-01-01 12:00:00 INFO request served in 12ms\n";
        std::vector<std::byte> bytes(size);
        for (std::size_t i = 0; i < size; ++i)
        {
            bytes[i] = static_cast<std::byte>(line[i % line.size()]);
        }
        return bytes;
    }

    std::span<const std::byte> chunk_of(const std::vector<std::byte> &data, std::uint64_t index,
                                        std::uint64_t chunk_size)
    {
        const auto offset = index * chunk_size;
        const auto length = std::min<std::uint64_t>(chunk_size, data.size() - offset);
        return std::span<const std::byte>(data).subspan(offset, length);
    }

    std::vector<std::byte> read_all(const std::filesystem::path &path)
    {
        std::ifstream in(path, std::ios::binary);
        std::vector<char> raw((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        std::vector<std::byte> bytes(raw.size());
        std::transform(raw.begin(), raw.end(), bytes.begin(), [](char c)
                       { return static_cast<std::byte>(c); });
        return bytes;
    }

    UploadConfig small_chunks(std::uint64_t chunk_size)
    {
        UploadConfig config;
        config.chunk_size = chunk_size;
        return config;
    }

    class RecordingObserver : public ProgressObserver
    {
    public:
        void on_session_created(const UploadSession &) override { ++created; }
        void on_progress(const ProgressReport &report) override { last_percent = report.percent; }
        void on_completed(const UploadSession &, std::uint64_t final_size) override { completed_size = final_size; }
        void on_removed(const std::string &) override { ++removed; }

        int created{0};
        int removed{0};
        double last_percent{0.0};
        std::uint64_t completed_size{0};
    };

    class BrokenObserver : public ProgressObserver
    {
    public:
        void on_session_created(const UploadSession &) override { throw std::runtime_error("mirror offline"); }
        void on_progress(const ProgressReport &) override { throw std::runtime_error("mirror offline"); }
        void on_removed(const std::string &) override { throw std::runtime_error("mirror offline"); }
    };

    void test_registry_create()
    {
        SessionRegistry registry(UploadConfig{});
        const auto now = std::chrono::system_clock::now();
        const auto session = registry.create("movie.bin", static_cast<std::int64_t>(3 * kMiB), now);

        assert(session.total_chunks == 3);
        assert(session.chunk_size == kMiB);
        assert(session.status == UploadStatus::Uploading);
        assert(session.session_id.size() == 32);
        assert(registry.get(session.session_id).filename == "movie.bin");

        const auto other = registry.create("movie.bin", static_cast<std::int64_t>(3 * kMiB), now);
        assert(other.session_id != session.session_id);
        assert(registry.size() == 2);

        const auto uneven = registry.create("odd.bin", static_cast<std::int64_t>(kMiB + 1), now);
        assert(uneven.total_chunks == 2);

        assert(error_of([&]
                        { registry.create("", 10, now); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { registry.create("zero.bin", 0, now); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { registry.create("neg.bin", -5, now); }) == ErrorCode::InvalidArgument);

        UploadConfig capped;
        capped.max_file_size = 1024;
        SessionRegistry limited(capped);
        assert(error_of([&]
                        { limited.create("big.bin", 1025, now); }) == ErrorCode::InvalidArgument);

        assert(!registry.find("missing").has_value());
        assert(error_of([&]
                        { (void)registry.get("missing"); }) == ErrorCode::NotFound);
    }

    void test_registry_transitions()
    {
        SessionRegistry registry(UploadConfig{});
        const auto now = std::chrono::system_clock::now();
        const auto id = registry.create("a.bin", 10, now).session_id;

        assert(!registry.transition(id, UploadStatus::Assembling, UploadStatus::Completed));
        assert(registry.transition(id, UploadStatus::Uploading, UploadStatus::Assembling));
        assert(registry.transition(id, UploadStatus::Assembling, UploadStatus::Completed));

        // Terminal states stay put.
        registry.mark_failed(id);
        assert(registry.get(id).status == UploadStatus::Completed);

        assert(registry.remove(id));
        assert(!registry.remove(id));
        assert(to_string(UploadStatus::Assembling) == "assembling");
    }

    void test_dynamic_chunk_sizes()
    {
        UploadConfig config;
        config.dynamic_chunk_size = true;
        assert(chunk_size_for(config, 5 * kMiB) == 512 * 1024);
        assert(chunk_size_for(config, 50 * kMiB) == kMiB);
        assert(chunk_size_for(config, 500 * kMiB) == 2 * kMiB);
        assert(chunk_size_for(config, 2048 * kMiB) == 4 * kMiB);

        config.dynamic_chunk_size = false;
        config.chunk_size = 4096;
        assert(chunk_size_for(config, 2048 * kMiB) == 4096);
    }

    void test_compression_policy()
    {
        UploadConfig config;
        const auto text = compression_settings_for(config, "server.LOG");
        assert(text.enabled);
        assert(text.level == 8);
        assert(text.min_size == 512);

        const auto media = compression_settings_for(config, "holiday.jpg");
        assert(!media.enabled);

        const auto other = compression_settings_for(config, "data.bin");
        assert(other.enabled);
        assert(other.level == 6);
        assert(other.min_size == 1024);

        config.enable_compression = false;
        assert(!compression_settings_for(config, "notes.txt").enabled);
    }

    void test_chunk_store_rules()
    {
        ChunkStore store(64 * kMiB);
        const auto now = std::chrono::system_clock::now();
        const CompressionSettings raw{};
        const auto payload = noise(1024, 1);

        assert(error_of([&]
                        { store.put("nope", 0, payload, raw, now); }) == ErrorCode::NotFound);

        store.open("s", 3, 1024);
        assert(error_of([&]
                        { store.put("s", -1, payload, raw, now); }) == ErrorCode::InvalidIndex);
        assert(error_of([&]
                        { store.put("s", 3, payload, raw, now); }) == ErrorCode::InvalidIndex);

        const auto oversized = noise(1025, 2);
        assert(error_of([&]
                        { store.put("s", 0, oversized, raw, now); }) == ErrorCode::InvalidArgument);

        const auto receipt = store.put("s", 1, payload, raw, now);
        assert(receipt.index == 1);
        assert(!receipt.compressed);
        assert(receipt.stored_size == payload.size());
        assert(receipt.checksum == crypto::hash_bytes(payload));
        assert(receipt.uploaded_chunks == 1);

        // Duplicate submissions are rejected and the stored chunk is unchanged.
        const auto replacement = noise(1024, 3);
        assert(error_of([&]
                        { store.put("s", 1, replacement, raw, now); }) == ErrorCode::DuplicateChunk);
        const auto stored = store.chunk("s", 1);
        assert(stored.has_value());
        assert(stored->data == payload);
        assert(store.stats("s").uploaded_chunks == 1);

        assert(error_of([&]
                        { (void)store.take_all("s"); }) == ErrorCode::Incomplete);
        assert(store.stats("s").uploaded_chunks == 1);
        assert(store.chunk("s", 1).has_value());

        store.drop("s");
        store.drop("s");
        assert(error_of([&]
                        { (void)store.stats("s"); }) == ErrorCode::NotFound);
        assert(store.buffered_bytes() == 0);
    }

    void test_chunk_store_compression()
    {
        ChunkStore store(64 * kMiB);
        const auto now = std::chrono::system_clock::now();
        const CompressionSettings enabled{.enabled = true, .level = 6, .min_size = 1024};
        store.open("c", 3, 8192);

        const auto text = text_bytes(8192);
        const auto compressed = store.put("c", 0, text, enabled, now);
        assert(compressed.compressed);
        assert(compressed.stored_size < text.size());
        assert(compressed.checksum == crypto::hash_bytes(text));

        // Random data does not shrink, so it is kept raw.
        const auto random = noise(8192, 4);
        const auto kept_raw = store.put("c", 1, random, enabled, now);
        assert(!kept_raw.compressed);
        assert(kept_raw.stored_size == random.size());

        // At or below the threshold nothing is attempted.
        const auto tiny = text_bytes(1024);
        assert(!store.put("c", 2, tiny, enabled, now).compressed);

        const auto stats = store.stats("c");
        assert(stats.original_bytes == text.size() + random.size() + tiny.size());
        assert(stats.stored_bytes == compressed.stored_size + random.size() + tiny.size());
        assert(store.buffered_bytes() == stats.stored_bytes);

        const auto chunks = store.take_all("c");
        assert(chunks.size() == 3);
        assert(chunks[0].index == 0 && chunks[2].index == 2);
        // Taken chunks still count until their owner hands the bytes back.
        assert(store.buffered_bytes() == stats.stored_bytes);
        assert(error_of([&]
                        { (void)store.take_all("c"); }) == ErrorCode::InvalidState);
        store.drop("c");
        assert(store.buffered_bytes() == stats.stored_bytes);
        store.release(stats.stored_bytes);
        assert(store.buffered_bytes() == 0);
    }

    void test_taken_chunks_keep_budget()
    {
        ChunkStore store(4096);
        const auto now = std::chrono::system_clock::now();
        const CompressionSettings raw{};
        store.open("first", 2, 1024);
        store.open("second", 3, 1024);
        store.put("first", 0, noise(1024, 30), raw, now);
        store.put("first", 1, noise(1024, 31), raw, now);

        auto taken = store.take_all("first");
        assert(taken.size() == 2);
        assert(store.buffered_bytes() == 2048);

        store.put("second", 0, noise(1024, 32), raw, now);
        store.put("second", 1, noise(1024, 33), raw, now);
        assert(error_of([&]
                        { store.put("second", 2, noise(1024, 34), raw, now); }) == ErrorCode::CapacityExceeded);

        store.release(taken[0].stored_size);
        store.put("second", 2, noise(1024, 34), raw, now);
        assert(store.buffered_bytes() == 4096);

        store.release(taken[1].stored_size);
        store.drop("second");
        assert(store.buffered_bytes() == 0);
    }

    void test_out_of_order_assembly()
    {
        const auto temp_root = fresh_dir("vaultdrop_assemble_test");
        UploadManager manager(UploadConfig{});

        const auto source = noise(3 * kMiB, 5);
        const auto descriptor = manager.create_session("three.bin", static_cast<std::int64_t>(source.size()));
        assert(descriptor.total_chunks == 3);
        assert(descriptor.chunk_size == kMiB);

        for (const std::int64_t index : {2, 0, 1})
        {
            manager.put_chunk(descriptor.session_id, index, chunk_of(source, static_cast<std::uint64_t>(index), kMiB));
        }

        const auto output = temp_root / "out" / "three.bin";
        const auto result = manager.assemble(descriptor.session_id, output);
        assert(result.final_size == source.size());
        assert(result.size_matches);
        assert(result.checksum == crypto::hash_bytes(source));
        assert(read_all(output) == source);
        assert(!std::filesystem::exists(temp_root / "out" / "three.bin.part"));

        assert(manager.progress(descriptor.session_id).status == UploadStatus::Completed);
        assert(manager.chunk_store().buffered_bytes() == 0);

        // Completed sessions are cleanup only.
        assert(error_of([&]
                        { manager.put_chunk(descriptor.session_id, 0, chunk_of(source, 0, kMiB)); }) ==
               ErrorCode::InvalidState);
        assert(error_of([&]
                        { manager.assemble(descriptor.session_id, output); }) == ErrorCode::InvalidState);

        manager.cleanup_session(descriptor.session_id);
        manager.cleanup_session(descriptor.session_id);
        assert(error_of([&]
                        { (void)manager.progress(descriptor.session_id); }) == ErrorCode::NotFound);

        cleanup_path(temp_root);
    }

    void test_permutation_roundtrip()
    {
        const auto temp_root = fresh_dir("vaultdrop_permutation_test");
        UploadManager manager(small_chunks(1000));
        std::mt19937 rng(42);

        for (const std::size_t size : {std::size_t{1}, std::size_t{999}, std::size_t{1000}, std::size_t{7777}})
        {
            const auto source = size % 2 == 0 ? text_bytes(size) : noise(size, static_cast<std::uint32_t>(size));
            const auto descriptor = manager.create_session("perm.log", static_cast<std::int64_t>(size));
            std::vector<std::int64_t> order(descriptor.total_chunks);
            std::iota(order.begin(), order.end(), 0);
            std::shuffle(order.begin(), order.end(), rng);

            for (const auto index : order)
            {
                manager.put_chunk(descriptor.session_id, index,
                                  chunk_of(source, static_cast<std::uint64_t>(index), descriptor.chunk_size));
            }
            const auto output = temp_root / ("perm_" + std::to_string(size));
            assert(manager.assemble(descriptor.session_id, output).final_size == size);
            assert(read_all(output) == source);
            manager.cleanup_session(descriptor.session_id);
        }

        cleanup_path(temp_root);
    }

    void test_incomplete_assembly()
    {
        const auto temp_root = fresh_dir("vaultdrop_incomplete_test");
        UploadManager manager(small_chunks(1024));
        const auto source = noise(3000, 6);
        const auto descriptor = manager.create_session("partial.bin", 3000);
        manager.put_chunk(descriptor.session_id, 0, chunk_of(source, 0, 1024));
        manager.put_chunk(descriptor.session_id, 2, chunk_of(source, 2, 1024));

        const auto output = temp_root / "partial.bin";
        assert(error_of([&]
                        { manager.assemble(descriptor.session_id, output); }) == ErrorCode::Incomplete);
        assert(!std::filesystem::exists(output));
        assert(manager.progress(descriptor.session_id).status == UploadStatus::Uploading);

        // The upload simply continues afterwards.
        manager.put_chunk(descriptor.session_id, 1, chunk_of(source, 1, 1024));
        assert(manager.assemble(descriptor.session_id, output).final_size == source.size());
        assert(read_all(output) == source);

        cleanup_path(temp_root);
    }

    void test_assembly_failure_marks_failed()
    {
        const auto temp_root = fresh_dir("vaultdrop_failure_test");
        UploadManager manager(small_chunks(1024));
        const auto source = noise(100, 7);
        const auto descriptor = manager.create_session("blocked.bin", 100);
        manager.put_chunk(descriptor.session_id, 0, source);

        // A regular file where the parent directory should be.
        const auto blocker = temp_root / "blocker";
        {
            std::ofstream out(blocker);
            out << "x";
        }
        assert(error_of([&]
                        { manager.assemble(descriptor.session_id, blocker / "blocked.bin"); }) ==
               ErrorCode::IOFailure);
        assert(manager.progress(descriptor.session_id).status == UploadStatus::Failed);
        assert(manager.chunk_store().buffered_bytes() == 0);
        assert(error_of([&]
                        { manager.put_chunk(descriptor.session_id, 0, source); }) == ErrorCode::InvalidState);

        manager.cleanup_session(descriptor.session_id);
        cleanup_path(temp_root);
    }

    void test_size_mismatch_is_warning()
    {
        const auto temp_root = fresh_dir("vaultdrop_mismatch_test");
        UploadManager manager(small_chunks(1024));
        const auto descriptor = manager.create_session("short.bin", 2000);
        const auto first = noise(1024, 8);
        const auto second = noise(10, 9);
        manager.put_chunk(descriptor.session_id, 0, first);
        manager.put_chunk(descriptor.session_id, 1, second);

        const auto result = manager.assemble(descriptor.session_id, temp_root / "short.bin");
        assert(result.final_size == 1034);
        assert(!result.size_matches);
        assert(manager.progress(descriptor.session_id).status == UploadStatus::Completed);

        cleanup_path(temp_root);
    }

    void test_progress_estimates()
    {
        const auto t0 = std::chrono::system_clock::now();
        UploadSession session{
            .session_id = "p",
            .filename = "p.bin",
            .total_size = 3000,
            .chunk_size = 1000,
            .total_chunks = 3,
            .created_at = t0,
            .last_activity = t0,
        };
        ChunkStats stats{.total_chunks = 3, .uploaded_chunks = 1, .stored_bytes = 1000, .original_bytes = 1000};

        const auto instant = estimate_progress(session, stats, t0);
        assert(instant.speed_bytes_per_sec == 0.0);
        assert(!instant.eta_seconds.has_value());
        assert(instant.uploaded_bytes == 1000);

        const auto later = estimate_progress(session, stats, t0 + std::chrono::seconds(2));
        assert(later.percent > 33.3 && later.percent < 33.4);
        assert(later.speed_bytes_per_sec == 500.0);
        assert(later.eta_seconds.has_value());
        assert(*later.eta_seconds == 4.0);

        const ChunkStats empty{.total_chunks = 3};
        const auto idle = estimate_progress(session, empty, t0 + std::chrono::seconds(5));
        assert(idle.percent == 0.0);
        assert(!idle.eta_seconds.has_value());

        // Compressed chunks report the smaller stored size.
        UploadManager manager(small_chunks(4096));
        const auto descriptor = manager.create_session("progress.txt", 8192);
        const auto receipt = manager.put_chunk(descriptor.session_id, 0, text_bytes(4096));
        assert(receipt.compressed);
        const auto report = manager.progress(descriptor.session_id);
        assert(report.percent == 50.0);
        assert(report.uploaded_bytes == receipt.stored_size);
        assert(report.uploaded_chunks == 1);
    }

    void test_backpressure()
    {
        UploadConfig config = small_chunks(1024);
        config.enable_compression = false;
        config.max_buffered_bytes = 2048;
        UploadManager manager(config);

        const auto descriptor = manager.create_session("pressure.bin", 4096);
        manager.put_chunk(descriptor.session_id, 0, noise(1024, 10));
        manager.put_chunk(descriptor.session_id, 1, noise(1024, 11));
        assert(error_of([&]
                        { manager.put_chunk(descriptor.session_id, 2, noise(1024, 12)); }) ==
               ErrorCode::CapacityExceeded);

        // Existing chunks are kept and the rejected index can be retried later.
        assert(manager.progress(descriptor.session_id).uploaded_chunks == 2);
        assert(manager.chunk_store().buffered_bytes() == 2048);

        manager.cleanup_session(descriptor.session_id);
        assert(manager.chunk_store().buffered_bytes() == 0);

        const auto retry = manager.create_session("pressure.bin", 1024);
        manager.put_chunk(retry.session_id, 0, noise(1024, 13));
    }

    void test_expiry()
    {
        auto observer = std::make_shared<RecordingObserver>();
        UploadManager manager(small_chunks(1024), observer);
        const auto stale = manager.create_session("stale.bin", 2048);
        const auto fresh = manager.create_session("fresh.bin", 2048);
        manager.put_chunk(stale.session_id, 0, noise(1024, 14));
        assert(observer->created == 2);

        const auto now = std::chrono::system_clock::now();
        assert(manager.expire_older_than(std::chrono::hours(1), now) == 0);
        assert(manager.active_sessions().size() == 2);

        // Only sessions idle for longer than the limit go.
        manager.put_chunk(fresh.session_id, 0, noise(1024, 15));
        assert(manager.expire_older_than(std::chrono::hours(1), now + std::chrono::hours(2)) == 2);
        assert(manager.active_sessions().empty());
        assert(manager.chunk_store().buffered_bytes() == 0);
        assert(observer->removed == 2);
        assert(error_of([&]
                        { manager.put_chunk(stale.session_id, 1, noise(1024, 16)); }) == ErrorCode::NotFound);

        const auto survivor = manager.create_session("survivor.bin", 1024);
        assert(manager.expire_older_than(std::chrono::seconds(0), std::chrono::system_clock::now() -
                                                                      std::chrono::seconds(1)) == 0);
        assert(manager.active_sessions().size() == 1);
        assert(manager.active_sessions().front().session_id == survivor.session_id);
    }

    void test_active_sessions()
    {
        UploadManager manager(small_chunks(1024));
        const auto first = manager.create_session("one.bin", 2048);
        manager.create_session("two.bin", 1024);
        manager.put_chunk(first.session_id, 1, noise(1024, 17));

        const auto sessions = manager.active_sessions();
        assert(sessions.size() == 2);
        const auto it = std::find_if(sessions.begin(), sessions.end(), [&](const SessionSummary &summary)
                                     { return summary.session_id == first.session_id; });
        assert(it != sessions.end());
        assert(it->filename == "one.bin");
        assert(it->percent == 50.0);
        assert(it->status == UploadStatus::Uploading);
    }

    void test_concurrent_uploads()
    {
        const auto temp_root = fresh_dir("vaultdrop_concurrency_test");
        UploadManager manager(small_chunks(4096));

        const auto first_source = noise(64 * 4096, 18);
        const auto second_source = text_bytes(48 * 4096 + 100);
        const auto first = manager.create_session("first.bin", static_cast<std::int64_t>(first_source.size()));
        const auto second = manager.create_session("second.txt", static_cast<std::int64_t>(second_source.size()));

        std::atomic<int> duplicates{0};
        std::vector<std::thread> workers;
        for (int worker = 0; worker < 8; ++worker)
        {
            workers.emplace_back([&, worker]
                                 {
                // Every chunk is submitted by two workers; exactly one of them wins.
                for (std::uint64_t index = 0; index < first.total_chunks; ++index)
                {
                    if (index % 4 != static_cast<std::uint64_t>(worker % 4))
                    {
                        continue;
                    }
                    try
                    {
                        manager.put_chunk(first.session_id, static_cast<std::int64_t>(index),
                                          chunk_of(first_source, index, 4096));
                    }
                    catch (const OperationError &error)
                    {
                        if (error.code() == ErrorCode::DuplicateChunk)
                        {
                            ++duplicates;
                        }
                    }
                }
                for (std::uint64_t index = static_cast<std::uint64_t>(worker); index < second.total_chunks; index += 8)
                {
                    manager.put_chunk(second.session_id, static_cast<std::int64_t>(index),
                                      chunk_of(second_source, index, 4096));
                    (void)manager.progress(second.session_id);
                } });
        }
        for (auto &worker : workers)
        {
            worker.join();
        }

        assert(duplicates.load() == static_cast<int>(first.total_chunks));
        assert(manager.progress(first.session_id).uploaded_chunks == first.total_chunks);
        assert(manager.progress(second.session_id).percent == 100.0);

        manager.assemble(first.session_id, temp_root / "first.bin");
        manager.assemble(second.session_id, temp_root / "second.txt");
        assert(read_all(temp_root / "first.bin") == first_source);
        assert(read_all(temp_root / "second.txt") == second_source);

        cleanup_path(temp_root);
    }

    void test_progress_mirror()
    {
        const auto temp_root = fresh_dir("vaultdrop_mirror_test");
        const auto mirror_dir = temp_root / "mirror";
        auto mirror = std::make_shared<JsonFileProgressMirror>(mirror_dir);
        UploadManager manager(small_chunks(1024), mirror);

        const auto descriptor = manager.create_session("mirrored.bin", 2048);
        const auto snapshot = mirror->snapshot_path(descriptor.session_id);
        assert(std::filesystem::exists(snapshot));

        manager.put_chunk(descriptor.session_id, 0, noise(1024, 19));
        {
            std::ifstream in(snapshot);
            nlohmann::json json;
            in >> json;
            assert(json.at("uploaded_chunks") == 1);
            assert(json.at("percent") == 50.0);
            assert(json.at("status") == "uploading");
        }

        manager.put_chunk(descriptor.session_id, 1, noise(1024, 20));
        manager.assemble(descriptor.session_id, temp_root / "mirrored.bin");
        {
            std::ifstream in(snapshot);
            nlohmann::json json;
            in >> json;
            assert(json.at("status") == "completed");
            assert(json.at("final_size") == 2048);
        }

        manager.cleanup_session(descriptor.session_id);
        assert(!std::filesystem::exists(snapshot));

        // A failing mirror never affects results.
        UploadManager unaffected(small_chunks(1024), std::make_shared<BrokenObserver>());
        const auto other = unaffected.create_session("ok.bin", 1024);
        unaffected.put_chunk(other.session_id, 0, noise(1024, 21));
        assert(unaffected.assemble(other.session_id, temp_root / "ok.bin").final_size == 1024);
        unaffected.cleanup_session(other.session_id);

        cleanup_path(temp_root);
    }

    void test_config_file()
    {
        const auto temp_root = fresh_dir("vaultdrop_config_test");
        const auto path = temp_root / "server.json";
        {
            std::ofstream out(path);
            out << R"({"port": 9000, "root": "/srv/vaultdrop", "expiry_interval": 600,
                      "upload": {"chunk_size": 2097152, "enable_compression": false}})";
        }

        ServerConfig config;
        config.address = "127.0.0.1";
        apply_config_file(path, config);
        assert(config.port == 9000);
        assert(config.root == "/srv/vaultdrop");
        assert(config.address == "127.0.0.1");
        assert(config.expiry_interval == std::chrono::seconds(600));
        assert(config.upload.chunk_size == 2 * kMiB);
        assert(!config.upload.enable_compression);
        assert(config.upload.compression_level == 6);
        assert(!config.mirror_dir.has_value());

        {
            std::ofstream out(path, std::ios::trunc);
            out << R"({"upload": {"chunk_size": 0}})";
        }
        bool threw = false;
        try
        {
            apply_config_file(path, config);
        }
        catch (const std::exception &)
        {
            threw = true;
        }
        assert(threw);

        bool missing = false;
        try
        {
            apply_config_file(temp_root / "absent.json", config);
        }
        catch (const std::runtime_error &)
        {
            missing = true;
        }
        assert(missing);

        cleanup_path(temp_root);
    }

    void test_config_warnings()
    {
        assert(validate_config(UploadConfig{}).empty());

        UploadConfig config;
        config.chunk_size = 1024;
        config.session_timeout = std::chrono::seconds(10);
        config.compression_level = 12;
        const auto warnings = validate_config(config);
        assert(warnings.size() == 3);
    }

    void write_file(const std::filesystem::path &path, const std::string &contents)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << contents;
    }

    void test_file_store_lifecycle()
    {
        const auto temp_root = fresh_dir("vaultdrop_file_store_test");
        FileStore store(temp_root, lock::kMinIterations);

        assert(error_of([&]
                        { (void)store.path_for("../escape"); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { (void)store.path_for("a/b"); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { (void)store.path_for(".hidden"); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { (void)store.path_for(""); }) == ErrorCode::InvalidArgument);

        const std::string contents = "hello world";
        const auto path = store.path_for("notes.txt");
        write_file(path, contents);
        const auto record = store.register_file("notes.txt", "checksum");
        assert(record.size == contents.size());
        assert(!record.locked);
        assert(store.contains("notes.txt"));
        assert(store.list().size() == 1);

        const auto range = store.read_range("notes.txt", 6, 100);
        assert(range.data.size() == 5);
        assert(range.done);
        const auto head = store.read_range("notes.txt", 0, 5);
        assert(!head.done);
        assert(error_of([&]
                        { (void)store.read_range("notes.txt", 99, 1); }) == ErrorCode::InvalidArgument);

        assert(error_of([&]
                        { store.lock("notes.txt", "abc"); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { store.unlock("notes.txt", "pass1234"); }) == ErrorCode::InvalidState);
        assert(error_of([&]
                        { store.lock("missing.txt", "pass1234"); }) == ErrorCode::NotFound);

        store.lock("notes.txt", "pass1234");
        const auto locked = store.get("notes.txt");
        assert(locked.locked);
        assert(locked.password_token.has_value());
        assert(locked.password_token->find("pass1234") == std::string::npos);
        assert(locked.size == contents.size());
        assert(std::filesystem::file_size(path) == lock::kHeaderSize + lock::kBlockSize);

        assert(error_of([&]
                        { store.lock("notes.txt", "pass1234"); }) == ErrorCode::InvalidState);
        assert(error_of([&]
                        { (void)store.read_range("notes.txt", 0, 10); }) == ErrorCode::InvalidState);
        assert(error_of([&]
                        { store.unlock("notes.txt", "wrong"); }) == ErrorCode::AuthenticationFailed);
        assert(store.get("notes.txt").locked);

        // Metadata survives a restart.
        {
            FileStore reloaded(temp_root, lock::kMinIterations);
            const auto persisted = reloaded.get("notes.txt");
            assert(persisted.locked);
            assert(persisted.checksum == "checksum");
        }

        store.unlock("notes.txt", "pass1234");
        assert(!store.get("notes.txt").locked);
        const auto plain = store.read_range("notes.txt", 0, 100);
        assert(std::string(reinterpret_cast<const char *>(plain.data.data()), plain.data.size()) == contents);

        cleanup_path(temp_root);
    }

    void test_file_store_delete()
    {
        const auto temp_root = fresh_dir("vaultdrop_delete_test");
        FileStore store(temp_root, lock::kMinIterations);

        write_file(store.path_for("open.bin"), "open");
        store.register_file("open.bin", "");
        store.remove("open.bin", std::nullopt);
        assert(!store.contains("open.bin"));
        assert(!std::filesystem::exists(store.path_for("open.bin")));
        assert(error_of([&]
                        { store.remove("open.bin", std::nullopt); }) == ErrorCode::NotFound);

        write_file(store.path_for("closed.bin"), "closed");
        store.register_file("closed.bin", "");
        store.lock("closed.bin", "pass1234");
        assert(error_of([&]
                        { store.remove("closed.bin", std::nullopt); }) == ErrorCode::AuthenticationFailed);
        assert(error_of([&]
                        { store.remove("closed.bin", std::string("wrong")); }) == ErrorCode::AuthenticationFailed);
        assert(store.contains("closed.bin"));
        store.remove("closed.bin", std::string("pass1234"));
        assert(!store.contains("closed.bin"));

        FileStore reloaded(temp_root, lock::kMinIterations);
        assert(reloaded.list().empty());

        cleanup_path(temp_root);
    }

    std::string as_text(const std::vector<std::byte> &bytes)
    {
        return std::string(reinterpret_cast<const char *>(bytes.data()), bytes.size());
    }

    std::filesystem::path sidecar_of(const std::filesystem::path &root, const std::string &name)
    {
        return root / ".vaultdrop" / "files" / (name + ".json");
    }

    // A non-empty directory in place of the sidecar makes every metadata write fail.
    void block_metadata(const std::filesystem::path &root, const std::string &name)
    {
        const auto sidecar = sidecar_of(root, name);
        std::filesystem::remove_all(sidecar);
        std::filesystem::create_directories(sidecar / "blocked");
    }

    void test_extension_allowlist()
    {
        assert((parse_extension_list(" .TXT, zip ,,pdf") == std::vector<std::string>{"txt", "zip", "pdf"}));
        assert(parse_extension_list("").empty());

        UploadConfig config = small_chunks(1024);
        assert(is_extension_allowed(config, "tool.exe"));

        config.allowed_extensions = {"txt", "zip"};
        UploadManager manager(config);
        manager.create_session("notes.TXT", 10);
        manager.create_session("bundle.zip", 10);
        assert(error_of([&]
                        { manager.create_session("tool.exe", 10); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { manager.create_session("README", 10); }) == ErrorCode::InvalidArgument);
        assert(error_of([&]
                        { manager.create_session("bundle.zip.exe", 10); }) == ErrorCode::InvalidArgument);
        assert(manager.active_sessions().size() == 2);

        const nlohmann::json json = config;
        assert(json.at("allowed_extensions").size() == 2);
        const auto parsed = nlohmann::json::parse(R"({"allowed_extensions": [".PDF", "csv"]})").get<UploadConfig>();
        assert((parsed.allowed_extensions == std::vector<std::string>{"pdf", "csv"}));
    }

    void test_lock_cost_survives_restart()
    {
        const auto temp_root = fresh_dir("vaultdrop_kdf_restart_test");
        const std::string contents = "quarterly numbers";
        {
            FileStore store(temp_root, lock::kMinIterations);
            write_file(store.path_for("report.csv"), contents);
            store.register_file("report.csv", "");
            store.lock("report.csv", "pass1234");
            assert(store.get("report.csv").kdf_iterations == lock::kMinIterations);
        }

        // Raising the configured cost must not strand files locked under the old one.
        {
            FileStore stronger(temp_root, lock::kMinIterations * 2);
            assert(stronger.get("report.csv").kdf_iterations == lock::kMinIterations);
            stronger.unlock("report.csv", "pass1234");
            assert(as_text(stronger.read_range("report.csv", 0, 100).data) == contents);
            assert(stronger.get("report.csv").kdf_iterations == 0);

            stronger.lock("report.csv", "pass1234");
            assert(stronger.get("report.csv").kdf_iterations == lock::kMinIterations * 2);
        }

        FileStore weaker(temp_root, lock::kMinIterations);
        weaker.unlock("report.csv", "pass1234");
        assert(as_text(weaker.read_range("report.csv", 0, 100).data) == contents);

        cleanup_path(temp_root);
    }

    void test_lock_restores_file_when_metadata_fails()
    {
        const auto temp_root = fresh_dir("vaultdrop_lock_rollback_test");
        FileStore store(temp_root, lock::kMinIterations);
        const std::string contents = "ledger entries";
        const auto path = store.path_for("ledger.txt");
        write_file(path, contents);
        store.register_file("ledger.txt", "");

        block_metadata(temp_root, "ledger.txt");
        assert(error_of([&]
                        { store.lock("ledger.txt", "pass1234"); }) == ErrorCode::IOFailure);
        assert(!store.get("ledger.txt").locked);
        assert(as_text(read_all(path)) == contents);
        assert(as_text(store.read_range("ledger.txt", 0, 100).data) == contents);
        assert(!std::filesystem::exists(temp_root / ".vaultdrop" / "files" / "ledger.txt.json.tmp"));

        std::filesystem::remove_all(sidecar_of(temp_root, "ledger.txt"));
        store.lock("ledger.txt", "pass1234");

        block_metadata(temp_root, "ledger.txt");
        assert(error_of([&]
                        { store.unlock("ledger.txt", "pass1234"); }) == ErrorCode::IOFailure);
        assert(store.get("ledger.txt").locked);
        assert(lock::is_well_formed_envelope(read_all(path)));
        assert(error_of([&]
                        { (void)store.read_range("ledger.txt", 0, 100); }) == ErrorCode::InvalidState);

        std::filesystem::remove_all(sidecar_of(temp_root, "ledger.txt"));
        store.unlock("ledger.txt", "pass1234");
        assert(as_text(read_all(path)) == contents);

        cleanup_path(temp_root);
    }

    void test_file_name_reservation()
    {
        const auto temp_root = fresh_dir("vaultdrop_reservation_test");
        FileStore store(temp_root, lock::kMinIterations);

        store.reserve("draft.txt");
        assert(error_of([&]
                        { store.reserve("draft.txt"); }) == ErrorCode::AlreadyExists);
        assert(!store.contains("draft.txt"));
        store.release_reservation("draft.txt");
        store.reserve("draft.txt");

        write_file(store.path_for("draft.txt"), "first");
        store.register_file("draft.txt", "");
        assert(error_of([&]
                        { store.reserve("draft.txt"); }) == ErrorCode::AlreadyExists);

        // A stored record, locked or not, is never silently replaced.
        store.lock("draft.txt", "pass1234");
        assert(error_of([&]
                        { store.register_file("draft.txt", ""); }) == ErrorCode::AlreadyExists);
        assert(store.get("draft.txt").locked);
        assert(error_of([&]
                        { store.reserve("../draft.txt"); }) == ErrorCode::InvalidArgument);

        cleanup_path(temp_root);
    }

    void test_reads_never_see_envelopes()
    {
        const auto temp_root = fresh_dir("vaultdrop_read_lock_test");
        FileStore store(temp_root, lock::kMinIterations);
        const std::string contents(4096, 'q');
        write_file(store.path_for("shared.txt"), contents);
        store.register_file("shared.txt", "");

        std::atomic<bool> done{false};
        std::atomic<int> bad_reads{0};
        std::thread reader([&]
                           {
            while (!done.load())
            {
                try
                {
                    if (as_text(store.read_range("shared.txt", 0, 8192).data) != contents)
                    {
                        ++bad_reads;
                    }
                }
                catch (const OperationError &error)
                {
                    if (error.code() != ErrorCode::InvalidState)
                    {
                        ++bad_reads;
                    }
                }
            } });
        for (int round = 0; round < 3; ++round)
        {
            store.lock("shared.txt", "pass1234");
            store.unlock("shared.txt", "pass1234");
        }
        done = true;
        reader.join();
        assert(bad_reads.load() == 0);

        store.remove("shared.txt", std::nullopt);
        assert(error_of([&]
                        { (void)store.read_range("shared.txt", 0, 10); }) == ErrorCode::NotFound);

        // The name is usable again once deleted.
        write_file(store.path_for("shared.txt"), contents);
        store.register_file("shared.txt", "");
        store.lock("shared.txt", "pass1234");
        assert(store.get("shared.txt").locked);

        cleanup_path(temp_root);
    }

    class OrderingObserver : public ProgressObserver
    {
    public:
        void on_progress(const ProgressReport &report) override { check(report.session_id); }
        void on_completed(const UploadSession &session, std::uint64_t) override { check(session.session_id); }

        void on_removed(const std::string &session_id) override
        {
            std::lock_guard lock(mutex_);
            removed_.insert(session_id);
        }

        std::atomic<int> late_events{0};

    private:
        void check(const std::string &session_id)
        {
            std::lock_guard lock(mutex_);
            if (removed_.contains(session_id))
            {
                ++late_events;
            }
        }

        std::mutex mutex_;
        std::set<std::string> removed_;
    };

    void test_no_events_after_removal()
    {
        auto observer = std::make_shared<OrderingObserver>();
        UploadManager manager(small_chunks(1024), observer);
        const auto payload = noise(1024, 40);

        for (int round = 0; round < 20; ++round)
        {
            const auto descriptor = manager.create_session("race.bin", 64 * 1024);
            std::vector<std::thread> workers;
            for (int worker = 0; worker < 4; ++worker)
            {
                workers.emplace_back([&, worker]
                                     {
                    for (std::int64_t index = worker; index < 64; index += 4)
                    {
                        try
                        {
                            manager.put_chunk(descriptor.session_id, index, payload);
                        }
                        catch (const OperationError &)
                        {
                            return;
                        }
                    } });
            }
            manager.cleanup_session(descriptor.session_id);
            for (auto &worker : workers)
            {
                worker.join();
            }
        }
        assert(observer->late_events.load() == 0);
        assert(manager.chunk_store().buffered_bytes() == 0);
    }

} // namespace

void run_server_component_tests()
{
    test_registry_create();
    test_registry_transitions();
    test_dynamic_chunk_sizes();
    test_compression_policy();
    test_chunk_store_rules();
    test_chunk_store_compression();
    test_taken_chunks_keep_budget();
    test_out_of_order_assembly();
    test_permutation_roundtrip();
    test_incomplete_assembly();
    test_assembly_failure_marks_failed();
    test_size_mismatch_is_warning();
    test_progress_estimates();
    test_backpressure();
    test_expiry();
    test_active_sessions();
    test_concurrent_uploads();
    test_progress_mirror();
    test_config_file();
    test_config_warnings();
    test_file_store_lifecycle();
    test_file_store_delete();
    test_extension_allowlist();
    test_lock_cost_survives_restart();
    test_lock_restores_file_when_metadata_fails();
    test_file_name_reservation();
    test_reads_never_see_envelopes();
    test_no_events_after_removal();
}
