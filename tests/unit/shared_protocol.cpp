#include <array>
#include <cctype>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <span>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "chunkvault/crypto.hpp"
#include "chunkvault/encoding/base64.hpp"
#include "chunkvault/error_codes.hpp"
#include "chunkvault/framing.hpp"
#include "chunkvault/protocol.hpp"

using namespace chunkvault;
using namespace chunkvault::protocol;

void run_server_component_tests();
void run_upload_manager_tests();

namespace
{

    std::vector<std::byte> to_bytes(std::string_view text)
    {
        std::vector<std::byte> bytes;
        for (const char ch : text)
        {
            bytes.push_back(static_cast<std::byte>(ch));
        }
        return bytes;
    }

    void test_request_roundtrip()
    {
        UploadInitRequest init{
            .file_name = "report.pdf",
            .total_size = 5'000'000,
            .chunk_size = 2'000'000,
            .declared_digest = std::nullopt,
            .owner_id = std::string("alice"),
        };
        RequestEnvelope envelope{};
        envelope.command = Command::UploadInit;
        envelope.payload = init;
        envelope.request_id = std::string("req-42");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "UPLOAD_INIT");
        const auto decoded = json.get<RequestEnvelope>();

        assert(decoded.command == Command::UploadInit);
        assert(decoded.payload == envelope.payload);
        assert(decoded.request_id == envelope.request_id);

        const auto decoded_init = decoded.payload.get<UploadInitRequest>();
        assert(decoded_init.file_name == "report.pdf");
        assert(decoded_init.total_size == 5'000'000);
        assert(decoded_init.owner_id == std::optional<std::string>("alice"));
        assert(!decoded_init.declared_digest);
    }

    void test_unknown_command_rejected()
    {
        const auto json = nlohmann::json{{"cmd", "LIST"}, {"payload", nlohmann::json::object()}};
        bool caught = false;
        try
        {
            (void)json.get<RequestEnvelope>();
        }
        catch (const std::exception &)
        {
            caught = true;
        }
        assert(caught);

        for (const auto label : {"PING", "UPLOAD_CHUNK", "UPLOAD_CHUNKS", "VALIDATE_CHUNK", "CLEANUP", "PLAN_CHUNKS",
                                 "FILE_INFO", "UPLOAD_CANCEL", "UPLOAD_MERGE", "UPLOAD_STATUS"})
        {
            const auto command = command_from_string(label);
            assert(command);
            assert(to_string(*command) == label);
        }
    }

    void test_error_response_roundtrip()
    {
        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Error;
        envelope.error = ErrorCode::StateConflict;
        envelope.message = "Session is Uploading, merge requires Completed";
        envelope.request_id = std::string("7");

        const auto json = nlohmann::json(envelope);
        assert(json.at("status") == "ERROR");
        assert(json.at("error") == to_int(ErrorCode::StateConflict));

        const auto decoded = json.get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::StateConflict);
        assert(decoded.message == envelope.message);
        assert(decoded.request_id == envelope.request_id);
    }

    void test_error_codes()
    {
        assert(to_string(ErrorCode::IntegrityError) == "integrity_error");
        assert(error_code_from_int(to_int(ErrorCode::Expired)) == ErrorCode::Expired);
        assert(error_code_from_int(999) == ErrorCode::InternalError);
    }

    void test_status_payload()
    {
        UploadStatusResponse response{};
        response.session_id = "abc";
        response.file_name = "a.bin";
        response.status = "Uploading";
        response.total_size = 5'000'000;
        response.chunk_size = 2'000'000;
        response.total_chunks = 3;
        response.uploaded_chunks = 1;
        response.progress = 100.0 / 3.0;
        response.uploaded_indices = {1};
        response.missing_indices = {0, 2};
        response.finalized_file_id = std::nullopt;

        const auto json = nlohmann::json(response);
        assert(!json.contains("file_id"));
        const auto decoded = json.get<UploadStatusResponse>();
        assert(decoded.status == "Uploading");
        assert(decoded.uploaded_indices == response.uploaded_indices);
        assert(decoded.missing_indices == response.missing_indices);
        assert(decoded.total_chunks == 3);
    }

    void test_merge_payload()
    {
        UploadMergeResponse response{
            .session_id = "s-1",
            .file = FinalizedFileDescriptor{
                .file_id = "f-1",
                .digest = std::string(64, 'a'),
                .size = 5'000'000,
                .locator = "files/a_20240101000000_0011aabb.bin",
                .created_at = 1700000000,
            },
            .deduplicated = true,
        };

        const auto decoded = nlohmann::json(response).get<UploadMergeResponse>();
        assert(decoded.session_id == "s-1");
        assert(decoded.file.file_id == "f-1");
        assert(decoded.file.size == 5'000'000);
        assert(decoded.file.locator == response.file.locator);
        assert(decoded.deduplicated);
    }

    void test_framing()
    {
        nlohmann::json message = {{"hello", "world"}, {"value", 42}};
        const auto frame = encode_frame(message);
        assert(frame.size() > kFrameHeaderSize);

        const auto length = read_frame_length(std::span<const std::uint8_t, kFrameHeaderSize>(frame.data(), kFrameHeaderSize));
        assert(length == frame.size() - kFrameHeaderSize);

        // A truncated buffer is not a frame yet.
        const auto partial = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1));
        assert(!partial);

        const auto decoded = try_decode_frame(frame);
        assert(decoded);
        assert(decoded->message == message);
        assert(decoded->bytes_consumed == frame.size());

        const FrameHeaderBytes oversized = {0xFF, 0xFF, 0xFF, 0xFF};
        bool caught = false;
        try
        {
            (void)try_decode_frame(oversized);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);

        // The largest accepted payload sits exactly at the limit.
        const FrameHeaderBytes at_limit = {0x01, 0x00, 0x00, 0x00};
        const auto header = parse_frame_header(at_limit);
        assert(header.payload_size == kMaxFramePayload);
        assert(header.frame_size() == kMaxFramePayload + kFrameHeaderSize);
        const FrameHeaderBytes over_limit = {0x01, 0x00, 0x00, 0x01};
        caught = false;
        try
        {
            (void)parse_frame_header(over_limit);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);

        // Keep-alive frames are consumed without a document.
        std::vector<std::uint8_t> stream = {0, 0, 0, 0};
        stream.insert(stream.end(), frame.begin(), frame.end());
        const auto keep_alive = try_decode_frame(stream);
        assert(keep_alive);
        assert(keep_alive->message.is_null());
        assert(keep_alive->bytes_consumed == kFrameHeaderSize);
        const auto next = try_decode_frame(std::span<const std::uint8_t>(stream).subspan(keep_alive->bytes_consumed));
        assert(next && next->message == message);

        const std::string body = R"({"cmd":"PING"})";
        const auto parsed = parse_frame_payload(
            std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(body.data()), body.size()));
        assert(parsed.at("cmd") == "PING");
    }

    void test_base64()
    {
        assert(encoding::encode_base64(to_bytes("foobar")) == "Zm9vYmFy");
        assert(encoding::encode_base64(to_bytes("fo")) == "Zm8=");
        assert(encoding::encode_base64(to_bytes("f")) == "Zg==");
        assert(encoding::encode_base64({}).empty());

        const auto decoded = encoding::decode_base64("Zm9v\nYmFy");
        assert(decoded);
        assert(*decoded == to_bytes("foobar"));

        const auto padded = encoding::decode_base64("Zm8=");
        assert(padded);
        assert(*padded == to_bytes("fo"));

        assert(!encoding::decode_base64("Zm8*"));

        // Chunk payloads must be whole, correctly padded groups.
        assert(!encoding::decode_base64("Zm8"));
        assert(!encoding::decode_base64("Zg==Zg=="));
        assert(!encoding::decode_base64("Z==="));
        assert(!encoding::decode_base64("Zg=a"));
        assert(encoding::decode_base64("")->empty());

        std::vector<std::byte> all_values;
        for (int value = 0; value < 256; ++value)
        {
            all_values.push_back(static_cast<std::byte>(value));
        }
        const auto encoded = encoding::encode_base64(all_values);
        assert(encoded.size() == 344);
        assert(encoded.ends_with("/w=="));
        assert(encoding::decode_base64(encoded) == all_values);
    }

    void test_crypto()
    {
        // BLAKE2b-256 of the empty input.
        assert(crypto::hash_bytes({}) == "0e5751c026e543b2e8ab2eb06099daa1d1e5df47778f7787faab45cdf12fe3a8");

        const std::array<std::byte, 4> chunk = {
            std::byte{0xDE},
            std::byte{0xAD},
            std::byte{0xBE},
            std::byte{0xEF},
        };
        const auto chunk_hash = crypto::hash_bytes(chunk);
        assert(chunk_hash.size() == 64);
        assert(crypto::is_well_formed_digest(chunk_hash));

        std::istringstream stream(std::string("\xDE\xAD\xBE\xEF", 4));
        const auto stream_hash = crypto::hash_stream(stream);
        assert(chunk_hash == stream_hash);

        crypto::Hasher hasher;
        hasher.update(std::span<const std::byte>(chunk).first(1));
        hasher.update(std::span<const std::byte>(chunk).subspan(1));
        assert(hasher.bytes_hashed() == 4);
        assert(hasher.finish() == chunk_hash);

        const auto temp_dir = std::filesystem::temp_directory_path();
        const auto file_path = temp_dir / "chunkvault_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xDE\xAD\xBE\xEF", 4);
        }
        const auto file_hash = crypto::hash_file(file_path);
        assert(file_hash == chunk_hash);
        std::filesystem::remove(file_path);

        auto upper = chunk_hash;
        for (auto &ch : upper)
        {
            ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
        }
        assert(crypto::digests_equal(upper, chunk_hash));
        assert(crypto::normalize_digest(upper) == chunk_hash);
        assert(!crypto::digests_equal(chunk_hash, crypto::hash_bytes(to_bytes("other"))));
        assert(!crypto::is_well_formed_digest("xyz"));

        const auto id_a = crypto::random_hex(16);
        const auto id_b = crypto::random_hex(16);
        assert(id_a.size() == 32);
        assert(id_a != id_b);
    }

} // namespace

int main()
{
    try
    {
        test_request_roundtrip();
        test_unknown_command_rejected();
        test_error_response_roundtrip();
        test_error_codes();
        test_status_payload();
        test_merge_payload();
        test_framing();
        test_base64();
        test_crypto();
        run_server_component_tests();
        run_upload_manager_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
