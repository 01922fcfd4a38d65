#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace nodeagent::tls {

/*
  OpenSSL helpers for the PEM material the agent is configured with.

  Failures on configured material throw util::ConfigError so the daemon
  refuses to start rather than serving with a broken identity.
*/

// Reads a PEM file fully. `what` names the material in error messages.
std::string ReadPemFile(const std::string& path, std::string_view what);

// DER encoding of the first certificate in `pem`, or nullopt if it does not parse.
std::optional<std::string> TryCertificatePemToDer(std::string_view pem);
std::string                CertificatePemToDer(std::string_view pem);

// Subject CN of the certificate, empty when absent or unparsable.
std::string CertificateCommonName(std::string_view pem);

// Checks the certificate parses, the key parses and the key belongs to the certificate.
void ValidateKeyPair(std::string_view certificate_pem, std::string_view private_key_pem);

struct SelfSignedCertificate {
  std::string certificate_pem;
  std::string private_key_pem;
};

inline constexpr int kDefaultRsaBits   = 2048;
inline constexpr int kDefaultValidDays = 3650;

// RSA key, CN = host, subjectAltName = host (DNS or IP), SHA-256 signature.
SelfSignedCertificate GenerateSelfSignedCertificate(const std::string& host, int rsa_bits = kDefaultRsaBits,
                                                    int valid_days = kDefaultValidDays);

} // namespace nodeagent::tls
