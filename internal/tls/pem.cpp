#include "pem.hpp"

#include <arpa/inet.h>
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rand.h>
#include <openssl/rsa.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>

#include <cstdint>
#include <fstream>
#include <memory>
#include <sstream>

#include "internal/util/errors.hpp"

namespace nodeagent::tls {

namespace {

using BioPtr       = std::unique_ptr<BIO, decltype(&BIO_free)>;
using X509Ptr      = std::unique_ptr<X509, decltype(&X509_free)>;
using PkeyPtr      = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using ExtensionPtr = std::unique_ptr<X509_EXTENSION, decltype(&X509_EXTENSION_free)>;

std::string OpenSslError() {
  const unsigned long code = ERR_get_error();
  if (code == 0) return "unknown OpenSSL error";
  char buffer[256];
  ERR_error_string_n(code, buffer, sizeof(buffer));
  ERR_clear_error();
  return buffer;
}

BioPtr MemoryBio(std::string_view data) {
  return BioPtr(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())), &BIO_free);
}

X509Ptr ParseCertificate(std::string_view pem) {
  auto bio = MemoryBio(pem);
  if (!bio) return X509Ptr(nullptr, &X509_free);
  return X509Ptr(PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), &X509_free);
}

PkeyPtr ParsePrivateKey(std::string_view pem) {
  auto bio = MemoryBio(pem);
  if (!bio) return PkeyPtr(nullptr, &EVP_PKEY_free);
  return PkeyPtr(PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), &EVP_PKEY_free);
}

std::string DrainBio(BIO* bio) {
  char*      data = nullptr;
  const long size = BIO_get_mem_data(bio, &data);
  return std::string(data, static_cast<size_t>(size));
}

bool IsIpAddress(const std::string& host) {
  unsigned char buffer[sizeof(struct in6_addr)];
  return inet_pton(AF_INET, host.c_str(), buffer) == 1 || inet_pton(AF_INET6, host.c_str(), buffer) == 1;
}

void Check(int rc, const char* step) {
  if (rc != 1) {
    throw util::ConfigError(std::string("certificate generation failed at ") + step + ": " + OpenSslError());
  }
}

} // namespace

std::string ReadPemFile(const std::string& path, std::string_view what) {
  if (path.empty()) {
    throw util::ConfigError(std::string(what) + " path is empty");
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw util::ConfigError("cannot read " + std::string(what) + " at " + path);
  }

  std::ostringstream contents;
  contents << in.rdbuf();
  if (contents.str().empty()) {
    throw util::ConfigError(std::string(what) + " at " + path + " is empty");
  }
  return contents.str();
}

std::optional<std::string> TryCertificatePemToDer(std::string_view pem) {
  auto cert = ParseCertificate(pem);
  if (!cert) {
    ERR_clear_error();
    return std::nullopt;
  }

  const int length = i2d_X509(cert.get(), nullptr);
  if (length <= 0) return std::nullopt;

  std::string    der(static_cast<size_t>(length), '\0');
  unsigned char* out = reinterpret_cast<unsigned char*>(der.data());
  if (i2d_X509(cert.get(), &out) != length) return std::nullopt;
  return der;
}

std::string CertificatePemToDer(std::string_view pem) {
  auto der = TryCertificatePemToDer(pem);
  if (!der) {
    throw util::ConfigError("certificate is not valid X.509 PEM");
  }
  return *der;
}

std::string CertificateCommonName(std::string_view pem) {
  auto cert = ParseCertificate(pem);
  if (!cert) {
    ERR_clear_error();
    return {};
  }

  X509_NAME* subject = X509_get_subject_name(cert.get());
  const int  index   = X509_NAME_get_index_by_NID(subject, NID_commonName, -1);
  if (index < 0) return {};

  const ASN1_STRING* data = X509_NAME_ENTRY_get_data(X509_NAME_get_entry(subject, index));
  return std::string(reinterpret_cast<const char*>(ASN1_STRING_get0_data(data)), static_cast<size_t>(ASN1_STRING_length(data)));
}

void ValidateKeyPair(std::string_view certificate_pem, std::string_view private_key_pem) {
  auto cert = ParseCertificate(certificate_pem);
  if (!cert) {
    throw util::ConfigError("certificate is not valid X.509 PEM: " + OpenSslError());
  }

  auto key = ParsePrivateKey(private_key_pem);
  if (!key) {
    throw util::ConfigError("private key is not valid PEM: " + OpenSslError());
  }

  if (X509_check_private_key(cert.get(), key.get()) != 1) {
    throw util::ConfigError("private key does not match certificate: " + OpenSslError());
  }
}

SelfSignedCertificate GenerateSelfSignedCertificate(const std::string& host, int rsa_bits, int valid_days) {
  if (host.empty()) {
    throw util::InvalidArgument("certificate host name is empty");
  }

  PkeyPtr key(EVP_RSA_gen(static_cast<unsigned int>(rsa_bits)), &EVP_PKEY_free);
  if (!key) {
    throw util::ConfigError("RSA key generation failed: " + OpenSslError());
  }

  X509Ptr cert(X509_new(), &X509_free);
  if (!cert) {
    throw util::ConfigError("X509_new failed: " + OpenSslError());
  }

  uint64_t serial = 0;
  Check(RAND_bytes(reinterpret_cast<unsigned char*>(&serial), sizeof(serial)), "serial");
  serial &= 0x7fffffffffffffffULL;

  Check(X509_set_version(cert.get(), 2), "version");
  Check(ASN1_INTEGER_set_uint64(X509_get_serialNumber(cert.get()), serial), "serial");
  if (!X509_gmtime_adj(X509_getm_notBefore(cert.get()), 0) ||
      !X509_gmtime_adj(X509_getm_notAfter(cert.get()), static_cast<long>(valid_days) * 24 * 60 * 60)) {
    throw util::ConfigError("certificate validity could not be set: " + OpenSslError());
  }
  Check(X509_set_pubkey(cert.get(), key.get()), "public key");

  X509_NAME* name = X509_get_subject_name(cert.get());
  Check(X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC, reinterpret_cast<const unsigned char*>(host.c_str()), -1, -1, 0),
        "subject");
  Check(X509_set_issuer_name(cert.get(), name), "issuer");

  X509V3_CTX ctx;
  X509V3_set_ctx_nodb(&ctx);
  X509V3_set_ctx(&ctx, cert.get(), cert.get(), nullptr, nullptr, 0);
  const std::string san = (IsIpAddress(host) ? "IP:" : "DNS:") + host;
  ExtensionPtr      extension(X509V3_EXT_conf_nid(nullptr, &ctx, NID_subject_alt_name, san.c_str()), &X509_EXTENSION_free);
  if (!extension) {
    throw util::ConfigError("subjectAltName could not be built: " + OpenSslError());
  }
  Check(X509_add_ext(cert.get(), extension.get(), -1), "subjectAltName");

  if (X509_sign(cert.get(), key.get(), EVP_sha256()) <= 0) {
    throw util::ConfigError("certificate signing failed: " + OpenSslError());
  }

  BioPtr cert_bio(BIO_new(BIO_s_mem()), &BIO_free);
  BioPtr key_bio(BIO_new(BIO_s_mem()), &BIO_free);
  if (!cert_bio || !key_bio) {
    throw util::ConfigError("BIO allocation failed: " + OpenSslError());
  }
  Check(PEM_write_bio_X509(cert_bio.get(), cert.get()), "PEM certificate");
  Check(PEM_write_bio_PrivateKey(key_bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr), "PEM key");

  return SelfSignedCertificate{DrainBio(cert_bio.get()), DrainBio(key_bio.get())};
}

} // namespace nodeagent::tls
