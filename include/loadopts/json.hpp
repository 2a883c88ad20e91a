#pragma once

#include <string>
#include <string_view>

#include <google/protobuf/struct.pb.h>

#include "loadopts/options.hpp"

namespace loadopts::json
{
    /* ========================================================================
     * Documents
     * ====================================================================== */

    /// Options as a JSON object; unset fields are omitted.
    std::string encode(const Options& opts);

    Options decode(std::string_view text);

    /**
     * @brief Decode `text` over an existing instance.
     *
     * Fields missing from the document keep their current value. On any
     * error `target` is left exactly as it was.
     */
    void decode_into(std::string_view text, Options& target);

    std::string encode(const TLSVersions& versions);
    TLSVersions decode_tls_versions(std::string_view text);

    /* ========================================================================
     * Value codecs
     *
     * `path` is the dotted location used in error messages.
     * ====================================================================== */

    google::protobuf::Struct to_struct(const Options& opts);
    void from_struct(const google::protobuf::Struct& object, Options& target);

    google::protobuf::Value to_value(const Stage& stage);
    Stage stage_from_value(const google::protobuf::Value& value, std::string_view path);

    google::protobuf::Value to_value(const TLSVersions& versions);
    TLSVersions tls_versions_from_value(const google::protobuf::Value& value, std::string_view path);

    google::protobuf::Value to_value(const TLSCipherSuites& suites);
    TLSCipherSuites tls_cipher_suites_from_value(const google::protobuf::Value& value, std::string_view path);

    google::protobuf::Value to_value(const TLSAuth& auth);
    TLSAuthPtr tls_auth_from_value(const google::protobuf::Value& value, std::string_view path);

} // namespace loadopts::json
