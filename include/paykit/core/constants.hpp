#pragma once
#include <cstddef>
#include <cstdint>
#include <string_view>
#include <chrono>

namespace paykit {

struct NoiseConstants {
    static constexpr std::string_view PROTOCOL_NAME = "Noise_IK_25519_ChaChaPoly_SHA256";
    static constexpr std::string_view PROLOGUE = "paykit-noise-v1";
    static constexpr size_t DH_LEN = 32;
    static constexpr size_t HASH_LEN = 32;
    static constexpr size_t KEY_LEN = 32;
    static constexpr size_t TAG_LEN = 16;
    static constexpr size_t NONCE_LEN = 12;
    static constexpr size_t MAX_MESSAGE_LEN = 65535;
    static constexpr size_t MAX_HINT_LEN = 64;
    /// e || enc(s) || enc(payload) with an empty payload.
    static constexpr size_t MIN_INITIATOR_MESSAGE_LEN = DH_LEN + (DH_LEN + TAG_LEN) + TAG_LEN;
    /// e || enc(empty payload).
    static constexpr size_t RESPONDER_MESSAGE_LEN = DH_LEN + TAG_LEN;
    static constexpr uint64_t MAX_NONCE = UINT64_MAX;
};

struct KeyConstants {
    static constexpr size_t X25519_KEY_SIZE = 32;
    static constexpr size_t MIN_SEED_SIZE = 32;
    static constexpr size_t SEED_SIZE = 32;
    static constexpr std::string_view DERIVATION_SALT = "paykit-noise-x25519-v1";
    static constexpr std::string_view CACHE_KEY_PREFIX = "noise.key.cache.";
    static constexpr std::string_view CACHE_INDEX_KEY = "noise.key.cache.index";
    static constexpr uint32_t DEFAULT_MAX_CACHED_EPOCHS = 5;
};

struct WireConstants {
    static constexpr size_t LENGTH_PREFIX_SIZE = 4;
    static constexpr size_t SESSION_ID_BYTES = 16;
    static constexpr size_t CONNECTION_ID_BYTES = 8;
};

struct TimeoutConstants {
    static constexpr std::chrono::seconds DEFAULT_CONNECT_TIMEOUT{30};
    static constexpr std::chrono::seconds DEFAULT_IO_TIMEOUT{30};
    static constexpr std::chrono::seconds DEFAULT_IDLE_TIMEOUT{30};
};

struct ServerConstants {
    static constexpr uint32_t DEFAULT_MAX_CONNECTIONS = 10;
    static constexpr uint32_t DEFAULT_WORKER_THREADS = 2;
    static constexpr size_t CONNECTION_TABLE_SHARDS = 8;
    static constexpr std::string_view DEFAULT_BIND_ADDRESS = "0.0.0.0";
};

struct ErrorCodes {
    static constexpr std::string_view WRONG_PAYEE = "WRONG_PAYEE";
    static constexpr std::string_view DECRYPTION_FAILED = "DECRYPTION_FAILED";
    static constexpr std::string_view INVALID_MESSAGE = "INVALID_MESSAGE";
    static constexpr std::string_view PROCESSING_ERROR = "PROCESSING_ERROR";
    static constexpr std::string_view LISTENER_FAILED = "LISTENER_FAILED";
    static constexpr std::string_view INIT_FAILED = "INIT_FAILED";
    static constexpr std::string_view UNKNOWN = "UNKNOWN";
};

struct EnvironmentKeys {
    static constexpr const char* PAYEE_NOISE_ENDPOINT = "PAYKIT_PAYEE_NOISE_ENDPOINT";
    static constexpr const char* LOG_LEVEL = "PAYKIT_LOG_LEVEL";
};

}
