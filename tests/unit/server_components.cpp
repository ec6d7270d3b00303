#include <atomic>
#include <cassert>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "shellfs/crypto.hpp"
#include "shellfs/server/arbiter.hpp"
#include "shellfs/server/dispatcher.hpp"
#include "shellfs/server/filesystem.hpp"
#include "shellfs/server/session_manager.hpp"

using namespace shellfs;
using namespace shellfs::server;
namespace protocol = shellfs::protocol;

namespace
{

    void cleanup_path(const std::filesystem::path &path)
    {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }

    std::filesystem::path fresh_root(const std::string &name)
    {
        const auto root = std::filesystem::temp_directory_path() / name;
        cleanup_path(root);
        return root;
    }

    std::string read_file(const std::filesystem::path &path)
    {
        std::ifstream input(path, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    }

    void write_file(const std::filesystem::path &path, const std::string &content)
    {
        std::ofstream output(path, std::ios::binary | std::ios::trunc);
        output << content;
    }

    std::vector<std::uint8_t> bytes_of(const std::string &text)
    {
        return std::vector<std::uint8_t>(text.begin(), text.end());
    }

    template <typename Fn>
    std::optional<ErrorCode> filesystem_error_of(Fn &&fn)
    {
        try
        {
            fn();
        }
        catch (const FilesystemError &ex)
        {
            return ex.code();
        }
        return std::nullopt;
    }

    ErrorCode error_code(const std::optional<protocol::Response> &response)
    {
        assert(response.has_value());
        const auto *error = std::get_if<protocol::Error>(&*response);
        assert(error != nullptr);
        return error->code;
    }

    template <typename T>
    const T &as(const std::optional<protocol::Response> &response)
    {
        assert(response.has_value());
        const auto *value = std::get_if<T>(&*response);
        assert(value != nullptr);
        return *value;
    }

    void test_filesystem_rejects_escapes()
    {
        const auto root = fresh_root("shellfs_fs_escape");
        Filesystem fs(root);
        std::filesystem::create_directories(fs.root() / "a");

        std::filesystem::path cwd = fs.change_directory({}, "a");
        assert(cwd == "a");

        assert(filesystem_error_of([&]
                                   { cwd = fs.change_directory(cwd, "../../etc"); }) == ErrorCode::PathEscape);
        assert(cwd == "a");
        assert(filesystem_error_of([&]
                                   { fs.make_directory(cwd, "../../outside"); }) == ErrorCode::PathEscape);
        assert(!std::filesystem::exists(root.parent_path() / "outside"));
        assert(filesystem_error_of([&]
                                   { fs.parent_directory({}); }) == ErrorCode::PathEscape);
        assert(fs.parent_directory("a").empty());

        // Absolute requests are anchored at the sandbox root.
        assert(fs.resolve(cwd, "/a") == fs.root() / "a");
        assert(fs.change_directory(cwd, "/") == std::filesystem::path{});

        const auto outside = fresh_root("shellfs_fs_escape_target");
        std::filesystem::create_directories(outside);
        std::error_code ec;
        std::filesystem::create_directory_symlink(outside, fs.root() / "link", ec);
        if (!ec)
        {
            assert(filesystem_error_of([&]
                                       { fs.change_directory({}, "link"); }) == ErrorCode::PathEscape);
        }

        cleanup_path(outside);
        cleanup_path(root);
    }

    void test_filesystem_operations()
    {
        const auto root = fresh_root("shellfs_fs_ops");
        Filesystem fs(root);

        fs.make_directory({}, "docs");
        assert(filesystem_error_of([&]
                                   { fs.make_directory({}, "docs"); }) == ErrorCode::AlreadyExists);
        write_file(fs.root() / "docs" / "note.txt", "hello");

        assert(filesystem_error_of([&]
                                   { fs.change_directory({}, "missing"); }) == ErrorCode::NotFound);
        assert(filesystem_error_of([&]
                                   { fs.change_directory({}, "docs/note.txt"); }) == ErrorCode::NotADirectory);

        const auto entries = fs.list("docs");
        assert(entries.size() == 1);
        assert(entries[0].name == "note.txt" && !entries[0].is_dir && entries[0].size == 5);

        fs.make_directory({}, "b");
        const auto root_entries = fs.list({});
        assert(root_entries.size() == 2);
        assert(root_entries[0].name == "b" && root_entries[0].is_dir);
        assert(root_entries[1].name == "docs");

        assert(fs.copy("docs", "note.txt", "../backup/2024/note.txt") == 5);
        assert(read_file(fs.root() / "backup" / "2024" / "note.txt") == "hello");
        fs.copy({}, "docs/note.txt", "b");
        assert(read_file(fs.root() / "b" / "note.txt") == "hello");
        assert(filesystem_error_of([&]
                                   { fs.copy({}, "docs", "elsewhere"); }) == ErrorCode::InvalidPayload);
        assert(filesystem_error_of([&]
                                   { fs.copy({}, "nope.txt", "x.txt"); }) == ErrorCode::NotFound);

        assert(filesystem_error_of([&]
                                   { fs.open_for_write({}, ".", "a/b.txt"); }) == ErrorCode::InvalidPayload);
        assert(filesystem_error_of([&]
                                   { fs.open_for_write({}, ".", ".."); }) == ErrorCode::InvalidPayload);
        assert(filesystem_error_of([&]
                                   { fs.open_for_read({}, "docs"); }) == ErrorCode::InvalidPayload);
        assert(filesystem_error_of([&]
                                   { fs.open_for_read({}, "ghost.bin"); }) == ErrorCode::NotFound);

        auto opened = fs.open_for_read("docs", "note.txt");
        assert(opened.size == 5);
        assert(opened.name == "note.txt");

        cleanup_path(root);
    }

    void test_session_manager_lookup_and_expiry()
    {
        const auto root = fresh_root("shellfs_sessions");
        Filesystem fs(root);
        SessionManager manager(std::chrono::seconds{300});
        const auto t0 = SessionManager::Clock::now();

        {
            auto lease = manager.get_or_create("10.0.0.1:4000", t0);
            assert(lease.created());
            lease->cwd = "docs";

            auto opened = fs.open_for_write({}, ".", "partial.bin");
            auto context = std::make_unique<TransferContext>();
            context->path = opened.path;
            context->file = std::move(opened.stream);
            context->total_size = 100;
            context->file << "unflushed";
            lease->transfer = std::move(context);
        }
        {
            auto again = manager.get_or_create("10.0.0.1:4000", t0 + std::chrono::seconds{1});
            assert(!again.created());
            assert(again->cwd == "docs");
        }
        manager.get_or_create("10.0.0.2:4000", t0);
        assert(manager.size() == 2);
        assert(manager.touch("10.0.0.2:4000", t0 + std::chrono::seconds{200}));
        assert(!manager.touch("10.0.0.9:1", t0));

        assert(manager.expire_idle(t0 + std::chrono::seconds{299}) == 0);
        assert(manager.expire_idle(t0 + std::chrono::seconds{300}) == 1);
        assert(!manager.get("10.0.0.1:4000"));
        assert(manager.get("10.0.0.2:4000"));
        // Closing the evicted transfer flushed what had been buffered.
        assert(read_file(fs.root() / "partial.bin") == "unflushed");

        auto reborn = manager.get_or_create("10.0.0.1:4000", t0 + std::chrono::seconds{301});
        assert(reborn.created());
        assert(reborn->cwd.empty());
        assert(!reborn->transfer_active());

        cleanup_path(root);
    }

    void test_session_manager_sweep_skips_leased_session()
    {
        SessionManager manager(std::chrono::seconds{1});
        const auto t0 = SessionManager::Clock::now();
        std::atomic<bool> held{false};
        std::atomic<bool> release{false};

        std::thread holder([&]
                           {
            auto lease = manager.get_or_create("peer:1", t0);
            held = true;
            while (!release)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds{1});
            } });
        while (!held)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds{1});
        }

        // Returns at once instead of waiting for the request in flight.
        assert(manager.expire_idle(t0 + std::chrono::seconds{10}) == 0);
        assert(manager.size() == 1);

        release = true;
        holder.join();
        assert(manager.expire_idle(t0 + std::chrono::seconds{10}) == 1);
        assert(manager.size() == 0);
    }

    void test_arbiter_admits_one_client()
    {
        auto arbiter = std::make_shared<ConnectionArbiter>();
        assert(arbiter->state() == ConnectionArbiter::State::Idle);
        {
            auto lease = arbiter->try_acquire();
            assert(lease.has_value());
            assert(arbiter->state() == ConnectionArbiter::State::Busy);
            assert(!arbiter->try_acquire());

            auto moved = std::move(*lease);
            lease.reset();
            assert(arbiter->state() == ConnectionArbiter::State::Busy);
        }
        assert(arbiter->state() == ConnectionArbiter::State::Idle);

        std::atomic<int> admitted{0};
        std::vector<std::optional<ConnectionArbiter::Lease>> held(8);
        std::vector<std::thread> contenders;
        for (std::size_t i = 0; i < held.size(); ++i)
        {
            contenders.emplace_back([&, i]
                                    {
                held[i] = arbiter->try_acquire();
                if (held[i])
                {
                    ++admitted;
                } });
        }
        for (auto &thread : contenders)
        {
            thread.join();
        }
        assert(admitted == 1);
        held.clear();
        assert(arbiter->state() == ConnectionArbiter::State::Idle);
    }

    void test_dispatcher_upload_scenario()
    {
        const auto root = fresh_root("shellfs_dispatch_upload");
        Filesystem fs(root);
        Dispatcher dispatcher(fs, TransportKind::Datagram);
        Session session;

        as<protocol::Ok>(dispatcher.dispatch(protocol::UploadStart{.file_name = "f.txt", .size = 10}, session));
        assert(session.transfer_active());

        const auto payload = bytes_of("0123456789");
        const auto ack = as<protocol::ChunkAck>(
            dispatcher.dispatch(protocol::UploadChunk{.id = 0, .data = payload, .is_last = true}, session));
        assert(ack.id == 0);
        assert(!session.transfer_active());
        assert(read_file(fs.root() / "f.txt") == "0123456789");

        // The final ack was lost: the retransmission is acknowledged, not re-applied.
        const auto replay = as<protocol::ChunkAck>(
            dispatcher.dispatch(protocol::UploadChunk{.id = 0, .data = payload, .is_last = true}, session));
        assert(replay.id == 0);
        assert(read_file(fs.root() / "f.txt") == "0123456789");

        assert(error_code(dispatcher.dispatch(protocol::UploadChunk{.id = 1, .data = payload, .is_last = true},
                                              session)) == ErrorCode::NoActiveTransfer);

        cleanup_path(root);
    }

    void test_dispatcher_directory_scenario()
    {
        const auto root = fresh_root("shellfs_dispatch_dirs");
        Filesystem fs(root);
        Dispatcher dispatcher(fs, TransportKind::Stream);
        Session session;

        as<protocol::Ok>(dispatcher.dispatch(protocol::MakeDirectory{.name = "x"}, session));
        as<protocol::Ok>(dispatcher.dispatch(protocol::ChangeDirectory{.path = "x"}, session));
        assert(session.cwd == "x");
        assert(as<protocol::Listing>(dispatcher.dispatch(protocol::ListDirectory{}, session)).entries.empty());

        assert(error_code(dispatcher.dispatch(protocol::ChangeDirectory{.path = "../../etc"}, session)) ==
               ErrorCode::PathEscape);
        assert(session.cwd == "x");
        assert(error_code(dispatcher.dispatch(protocol::MakeDirectory{.name = "."}, session)) ==
               ErrorCode::AlreadyExists);

        as<protocol::Ok>(dispatcher.dispatch(protocol::ChangeDirectoryUp{}, session));
        assert(session.cwd.empty());
        assert(error_code(dispatcher.dispatch(protocol::ChangeDirectoryUp{}, session)) == ErrorCode::PathEscape);

        write_file(fs.root() / "x" / "a.txt", "abc");
        as<protocol::Ok>(dispatcher.dispatch(protocol::CopyFile{.source = "x/a.txt", .destination = "y/b.txt"}, session));
        assert(read_file(fs.root() / "y" / "b.txt") == "abc");

        // Chunk messages belong to the datagram transport.
        assert(error_code(dispatcher.dispatch(protocol::UploadChunk{.id = 0}, session)) == ErrorCode::InvalidCommand);
        assert(error_code(dispatcher.dispatch(protocol::DownloadChunk{.id = 0}, session)) == ErrorCode::InvalidCommand);

        cleanup_path(root);
    }

    void test_dispatcher_chunk_ordering()
    {
        const auto root = fresh_root("shellfs_dispatch_order");
        Filesystem fs(root);
        Dispatcher dispatcher(fs, TransportKind::Datagram);
        Session session;

        assert(error_code(dispatcher.dispatch(protocol::UploadChunk{.id = 0}, session)) ==
               ErrorCode::NoActiveTransfer);

        as<protocol::Ok>(
            dispatcher.dispatch(protocol::UploadStart{.file_name = "data.bin", .size = 6, .directory = "in"}, session));
        assert(error_code(dispatcher.dispatch(protocol::UploadStart{.file_name = "other.bin", .size = 1}, session)) ==
               ErrorCode::TransferAlreadyActive);
        assert(error_code(dispatcher.dispatch(protocol::DownloadStart{.source_path = "in/data.bin"}, session)) ==
               ErrorCode::TransferAlreadyActive);
        assert(session.transfer->path.filename() == "data.bin");

        assert(as<protocol::ChunkAck>(dispatcher.dispatch(
                   protocol::UploadChunk{.id = 0, .data = bytes_of("abc"), .is_last = false}, session))
                   .id == 0);
        assert(as<protocol::ChunkAck>(dispatcher.dispatch(
                   protocol::UploadChunk{.id = 0, .data = bytes_of("abc"), .is_last = false}, session))
                   .id == 0);
        assert(!dispatcher.dispatch(protocol::UploadChunk{.id = 2, .data = bytes_of("zzz"), .is_last = true}, session));
        assert(session.transfer->sequencer.expected() == 1);
        assert(session.transfer->bytes_transferred == 3);

        assert(as<protocol::ChunkAck>(dispatcher.dispatch(
                   protocol::UploadChunk{.id = 1, .data = bytes_of("def"), .is_last = true}, session))
                   .id == 1);
        assert(!session.transfer_active());
        assert(read_file(fs.root() / "in" / "data.bin") == "abcdef");

        cleanup_path(root);
    }

    void test_dispatcher_rejects_overflowing_upload()
    {
        const auto root = fresh_root("shellfs_dispatch_overflow");
        Filesystem fs(root);
        Dispatcher dispatcher(fs, TransportKind::Datagram);
        Session session;

        as<protocol::Ok>(dispatcher.dispatch(protocol::UploadStart{.file_name = "small.bin", .size = 2}, session));
        assert(error_code(dispatcher.dispatch(
                   protocol::UploadChunk{.id = 0, .data = bytes_of("abc"), .is_last = true}, session)) ==
               ErrorCode::InvalidPayload);
        assert(!session.transfer_active());

        assert(error_code(dispatcher.dispatch(protocol::UploadStart{.file_name = "../x", .size = 1}, session)) ==
               ErrorCode::InvalidPayload);
        assert(!session.transfer_active());

        Dispatcher narrow(fs, TransportKind::Datagram, 4);
        as<protocol::Ok>(narrow.dispatch(protocol::UploadStart{.file_name = "wide.bin", .size = 10}, session));
        assert(error_code(narrow.dispatch(
                   protocol::UploadChunk{.id = 0, .data = bytes_of("abcdef"), .is_last = false}, session)) ==
               ErrorCode::InvalidPayload);
        assert(!session.transfer_active());

        cleanup_path(root);
    }

    void test_dispatcher_answers_repeated_start()
    {
        const auto root = fresh_root("shellfs_dispatch_repeat");
        Filesystem fs(root);
        Dispatcher dispatcher(fs, TransportKind::Datagram, 4);
        Session session;

        const protocol::UploadStart upload{.file_name = "r.bin", .size = 6, .directory = "in"};
        as<protocol::Ok>(dispatcher.dispatch(upload, session));
        as<protocol::Ok>(dispatcher.dispatch(upload, session));
        assert(error_code(dispatcher.dispatch(protocol::UploadStart{.file_name = "r.bin", .size = 7, .directory = "in"},
                                              session)) == ErrorCode::TransferAlreadyActive);

        as<protocol::ChunkAck>(
            dispatcher.dispatch(protocol::UploadChunk{.id = 0, .data = bytes_of("abcd"), .is_last = false}, session));
        // Once data has moved the start is no longer a retransmission.
        assert(error_code(dispatcher.dispatch(upload, session)) == ErrorCode::TransferAlreadyActive);
        as<protocol::ChunkAck>(
            dispatcher.dispatch(protocol::UploadChunk{.id = 1, .data = bytes_of("ef"), .is_last = true}, session));
        assert(read_file(fs.root() / "in" / "r.bin") == "abcdef");

        write_file(fs.root() / "d.bin", "0123456789");
        const protocol::DownloadStart download{.source_path = "d.bin"};
        const auto first = as<protocol::FileMetadata>(dispatcher.dispatch(download, session));
        const auto again = as<protocol::FileMetadata>(dispatcher.dispatch(download, session));
        assert(again.name == first.name && again.size == 10 && again.content_hash == first.content_hash);
        assert(first.content_hash.has_value());

        const auto chunk = as<protocol::FileChunk>(dispatcher.dispatch(protocol::DownloadChunk{.id = 0}, session));
        assert(chunk.data == bytes_of("0123"));
        assert(error_code(dispatcher.dispatch(download, session)) == ErrorCode::TransferAlreadyActive);
        session.end_transfer();

        // The stream transport never sees a retransmitted start.
        Dispatcher stream(fs, TransportKind::Stream);
        Session stream_session;
        as<protocol::Ok>(stream.dispatch(upload, stream_session));
        assert(error_code(stream.dispatch(upload, stream_session)) == ErrorCode::TransferAlreadyActive);
        stream_session.end_transfer();

        cleanup_path(root);
    }

    void test_dispatcher_download_scenario()
    {
        const auto root = fresh_root("shellfs_dispatch_download");
        Filesystem fs(root);
        Dispatcher dispatcher(fs, TransportKind::Datagram, 8);
        Session session;
        const std::string content = "abcdefghijklmnopqrst";
        write_file(fs.root() / "big.bin", content);

        const auto metadata =
            as<protocol::FileMetadata>(dispatcher.dispatch(protocol::DownloadStart{.source_path = "big.bin"}, session));
        assert(metadata.name == "big.bin");
        assert(metadata.size == content.size());
        assert(metadata.content_hash == crypto::hash_file(fs.root() / "big.bin"));

        const auto first = as<protocol::FileChunk>(dispatcher.dispatch(protocol::DownloadChunk{.id = 0}, session));
        assert(first.id == 0 && first.data == bytes_of("abcdefgh") && !first.is_last);
        const auto resent = as<protocol::FileChunk>(dispatcher.dispatch(protocol::DownloadChunk{.id = 0}, session));
        assert(resent.data == first.data);
        assert(!dispatcher.dispatch(protocol::DownloadChunk{.id = 2}, session));

        const auto second = as<protocol::FileChunk>(dispatcher.dispatch(protocol::DownloadChunk{.id = 1}, session));
        assert(second.data == bytes_of("ijklmnop") && !second.is_last);
        const auto last = as<protocol::FileChunk>(dispatcher.dispatch(protocol::DownloadChunk{.id = 2}, session));
        assert(last.data == bytes_of("qrst") && last.is_last);
        assert(!session.transfer_active());

        const auto replay = as<protocol::FileChunk>(dispatcher.dispatch(protocol::DownloadChunk{.id = 2}, session));
        assert(replay.is_last && replay.data == last.data);
        assert(error_code(dispatcher.dispatch(protocol::DownloadChunk{.id = 3}, session)) ==
               ErrorCode::NoActiveTransfer);

        assert(error_code(dispatcher.dispatch(protocol::DownloadStart{.source_path = "../etc/passwd"}, session)) ==
               ErrorCode::PathEscape);

        cleanup_path(root);
    }

} // namespace

void run_server_component_tests()
{
    test_filesystem_rejects_escapes();
    test_filesystem_operations();
    test_session_manager_lookup_and_expiry();
    test_session_manager_sweep_skips_leased_session();
    test_arbiter_admits_one_client();
    test_dispatcher_upload_scenario();
    test_dispatcher_directory_scenario();
    test_dispatcher_chunk_ordering();
    test_dispatcher_rejects_overflowing_upload();
    test_dispatcher_answers_repeated_start();
    test_dispatcher_download_scenario();
}
