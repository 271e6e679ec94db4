#include <array>
#include <cassert>
#include <iostream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "nimbus/crypto.hpp"
#include "nimbus/encoding/base64.hpp"
#include "nimbus/framing.hpp"
#include "nimbus/protocol.hpp"

using namespace nimbus;
using namespace nimbus::protocol;

void run_client_core_tests();
void run_client_transfer_tests();
void run_server_component_tests();

namespace
{

    std::vector<std::byte> bytes_of(std::string_view text)
    {
        std::vector<std::byte> out(text.size());
        for (std::size_t i = 0; i < text.size(); ++i)
        {
            out[i] = static_cast<std::byte>(text[i]);
        }
        return out;
    }

    void test_request_roundtrip()
    {
        RequestEnvelope envelope{};
        envelope.command = Command::ListChildren;
        envelope.payload = NodeRequest{.node_id = "abc123"};
        envelope.request_id = std::string("req-42");
        envelope.session_token = std::string("token");

        const auto json = nlohmann::json(envelope);
        assert(json.at("cmd") == "LIST_CHILDREN");
        const auto decoded = json.get<RequestEnvelope>();

        assert(decoded.command == Command::ListChildren);
        assert(decoded.payload == envelope.payload);
        assert(decoded.request_id == envelope.request_id);
        assert(decoded.session_token == envelope.session_token);
        assert(decoded.payload.get<NodeRequest>().node_id == "abc123");
    }

    void test_unknown_command_rejected()
    {
        const nlohmann::json json = {{"cmd", "FORMAT_DISK"}, {"payload", nlohmann::json::object()}};
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
        assert(!command_from_string("FORMAT_DISK"));
        assert(command_from_string(to_string(Command::UploadCommit)) == Command::UploadCommit);
        assert(std::string(to_string(Command::Copy)) == "COPY");
        assert(command_from_string("COPY") == Command::Copy);
    }

    void test_error_response_roundtrip()
    {
        ResponseEnvelope envelope{};
        envelope.kind = ResponseKind::Error;
        envelope.error = ErrorCode::QuotaExceeded;
        envelope.message = "Storage quota exceeded";
        envelope.request_id = std::string("req-7");

        const auto decoded = nlohmann::json(envelope).get<ResponseEnvelope>();
        assert(decoded.kind == ResponseKind::Error);
        assert(decoded.error == ErrorCode::QuotaExceeded);
        assert(decoded.message == envelope.message);
        assert(decoded.request_id == envelope.request_id);

        assert(to_string(ErrorCode::IntegrityMismatch) == "integrity_mismatch");
        assert(error_code_from_int(to_int(ErrorCode::SessionExpired)) == ErrorCode::SessionExpired);
        assert(error_code_from_int(9999) == ErrorCode::InternalError);
    }

    void test_node_record_optional_fields()
    {
        NodeRecord root{.id = "r", .parent_id = std::nullopt, .name = "", .kind = NodeKind::Root};
        const auto root_json = nlohmann::json(root);
        assert(!root_json.contains("parent"));
        assert(!root_json.contains("key"));
        const auto decoded_root = root_json.get<NodeRecord>();
        assert(!decoded_root.parent_id);
        assert(decoded_root.kind == NodeKind::Root);

        NodeRecord file{
            .id = "f",
            .parent_id = std::string("r"),
            .name = "notes.txt",
            .kind = NodeKind::File,
            .size = 1024,
            .content_key = "d3JhcHBlZA==",
            .modified_time = 1700000000,
        };
        const auto decoded_file = nlohmann::json(file).get<NodeRecord>();
        assert(decoded_file.parent_id == file.parent_id);
        assert(decoded_file.size == 1024);
        assert(decoded_file.content_key == file.content_key);
        assert(decoded_file.modified_time == file.modified_time);
    }

    void test_move_request_rename_is_optional()
    {
        MoveRequest keep_name{.node_id = "n", .new_parent_id = "p"};
        assert(!nlohmann::json(keep_name).get<MoveRequest>().new_name);

        MoveRequest rename{.node_id = "n", .new_parent_id = "p", .new_name = std::string("renamed")};
        assert(nlohmann::json(rename).get<MoveRequest>().new_name == rename.new_name);
    }

    void test_framing()
    {
        UploadInitRequest init{
            .parent_id = "root",
            .name = "notes.txt",
            .size = 4096,
            .encrypted_size = 4096 + 4 * crypto::kChunkTagBytes,
            .chunk_size = 1024,
            .resume_id = std::string("u-1"),
        };

        RequestEnvelope envelope{};
        envelope.command = Command::UploadInit;
        envelope.payload = init;

        const auto frame = encode_frame(nlohmann::json(envelope));
        const auto decoded = try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size()));
        assert(decoded.has_value());
        assert(decoded->bytes_consumed == frame.size());
        const auto decoded_init = decoded->message.get<RequestEnvelope>().payload.get<UploadInitRequest>();
        assert(decoded_init.encrypted_size == init.encrypted_size);
        assert(decoded_init.resume_id == init.resume_id);

        // A frame cut short is not decodable yet.
        assert(!try_decode_frame(std::span<const std::uint8_t>(frame.data(), frame.size() - 1)));
        assert(!try_decode_frame(std::span<const std::uint8_t>(frame.data(), 2)));

        const std::array<std::uint8_t, kFrameHeaderSize> oversized{0xFF, 0xFF, 0xFF, 0xFF};
        bool caught = false;
        try
        {
            (void)decode_frame_size(oversized);
        }
        catch (const std::length_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_encoding()
    {
        const auto data = bytes_of("nimbus");
        const auto encoded = encoding::encode_base64(data);
        assert(encoded == "bmltYnVz");
        assert(encoding::decode_base64(encoded) == data);
        assert(encoding::decode_base64("").empty());

        bool caught = false;
        try
        {
            (void)encoding::decode_base64("not base64!");
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);

        const auto hex = encoding::encode_hex(data);
        assert(hex == "6e696d627573");
        assert(encoding::decode_hex(hex) == data);

        caught = false;
        try
        {
            (void)encoding::decode_hex("abc");
        }
        catch (const std::invalid_argument &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_password_hash()
    {
        const std::string password = "correct horse battery staple";
        const auto hashed = crypto::hash_password(password);
        assert(crypto::verify_password(password, hashed));
        assert(!crypto::verify_password("wrong password", hashed));
    }

    void test_chunk_sealing()
    {
        const auto key = crypto::SecretKey::random();
        const auto plaintext = bytes_of("segment payload");

        const auto sealed = crypto::seal_chunk(key, 4096, plaintext);
        assert(sealed.size() == plaintext.size() + crypto::kChunkTagBytes);

        const auto opened = crypto::open_chunk(key, 4096, sealed);
        assert(opened && *opened == plaintext);

        // The offset is bound into both the nonce and the associated data.
        assert(!crypto::open_chunk(key, 0, sealed));
        assert(!crypto::open_chunk(crypto::SecretKey::random(), 4096, sealed));

        auto tampered = sealed;
        tampered[0] ^= std::byte{0x80};
        assert(!crypto::open_chunk(key, 4096, tampered));

        const auto nonce = crypto::chunk_nonce(0x0102);
        assert(nonce[0] == std::byte{0x02});
        assert(nonce[1] == std::byte{0x01});
        assert(nonce[8] == std::byte{0x00} && nonce[11] == std::byte{0x00});
    }

    void test_key_wrapping()
    {
        const auto salt = crypto::random_bytes(crypto::kSaltBytes);
        const auto password_key = crypto::derive_password_key("hunter2", salt, crypto::KdfLimits::minimum());
        assert(password_key == crypto::derive_password_key("hunter2", salt, crypto::KdfLimits::minimum()));
        assert(!(password_key == crypto::derive_password_key("hunter3", salt, crypto::KdfLimits::minimum())));

        const auto master = crypto::SecretKey::random();
        const auto wrapped = crypto::wrap_key(password_key, master);
        const auto unwrapped = crypto::unwrap_key(password_key, wrapped);
        assert(unwrapped && *unwrapped == master);
        assert(!crypto::unwrap_key(crypto::SecretKey::random(), wrapped));
    }

    void test_aggregate_mac()
    {
        const auto key = crypto::SecretKey::random();
        const auto first = crypto::tag_of(crypto::seal_chunk(key, 0, bytes_of("first")));
        const auto second = crypto::tag_of(crypto::seal_chunk(key, 5, bytes_of("second")));

        const std::array<crypto::ChunkTag, 2> ordered{first, second};
        const std::array<crypto::ChunkTag, 2> swapped{second, first};
        const auto mac = crypto::aggregate_mac(key, ordered);
        assert(mac.size() == crypto::kMacBytes * 2);
        assert(mac == crypto::aggregate_mac(key, ordered));
        assert(mac != crypto::aggregate_mac(key, swapped));
        assert(mac != crypto::aggregate_mac(crypto::SecretKey::random(), ordered));

        assert(crypto::constant_time_equals(mac, mac));
        assert(!crypto::constant_time_equals(mac, crypto::aggregate_mac(key, swapped)));
        assert(!crypto::constant_time_equals(mac, mac.substr(1)));
    }

    void test_random_ids()
    {
        const auto id = crypto::random_id();
        assert(id.size() == 32);
        assert(id.find_first_not_of("0123456789abcdef") == std::string::npos);
        assert(id != crypto::random_id());
    }

} // namespace

int main()
{
    try
    {
        crypto::ensure_sodium_init();

        test_request_roundtrip();
        test_unknown_command_rejected();
        test_error_response_roundtrip();
        test_node_record_optional_fields();
        test_move_request_rename_is_optional();
        test_framing();
        test_encoding();
        test_password_hash();
        test_chunk_sealing();
        test_key_wrapping();
        test_aggregate_mac();
        test_random_ids();

        run_client_core_tests();
        run_client_transfer_tests();
        run_server_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed" << std::endl;
    return 0;
}
