#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>

#include <memory>
#include <new>
#include <stdexcept>
#include <string>
#include <string_view>

namespace tlsdial {

// Function pointer deleters keep type size = one pointer
using SslCtxPtr = std::unique_ptr<SSL_CTX, decltype(&::SSL_CTX_free)>;
using SslPtr = std::unique_ptr<SSL, decltype(&::SSL_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&::BIO_free)>;
using BioMethodPtr = std::unique_ptr<BIO_METHOD, decltype(&::BIO_meth_free)>;
using X509Ptr = std::unique_ptr<X509, decltype(&::X509_free)>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, decltype(&::EVP_PKEY_free)>;

// Takes ownership of an object returned by an OpenSSL allocator, null meaning allocation failure.
template <class OwnedPtr>
OwnedPtr Owned(typename OwnedPtr::pointer raw, typename OwnedPtr::deleter_type deleter) {
  if (raw == nullptr) {
    throw std::bad_alloc();
  }
  return OwnedPtr(raw, deleter);
}

inline BioPtr MakeBio(BIO* bio) { return Owned<BioPtr>(bio, ::BIO_free); }

inline BioPtr MakeMemBio(std::string_view data) {
  return MakeBio(::BIO_new_mem_buf(data.data(), static_cast<int>(data.size())));
}

inline BioPtr MakeMemoryBio() { return MakeBio(::BIO_new(::BIO_s_mem())); }

inline SslPtr MakeSsl(SSL* ssl) { return Owned<SslPtr>(ssl, ::SSL_free); }

inline SslCtxPtr MakeSslCtx(const SSL_METHOD* method) { return Owned<SslCtxPtr>(::SSL_CTX_new(method), ::SSL_CTX_free); }

// Adopts an X509 reference already owned by the caller (e.g. from SSL_get1_peer_certificate).
inline X509Ptr AdoptX509(X509* x509) { return Owned<X509Ptr>(x509, ::X509_free); }

inline PKeyPtr AdoptPKey(EVP_PKEY* pkey) { return Owned<PKeyPtr>(pkey, ::EVP_PKEY_free); }

// Parse the first PEM certificate of pem. Throws std::runtime_error naming what if it cannot be parsed.
inline X509Ptr ReadPemCertificate(std::string_view pem, std::string_view what) {
  auto bio = MakeMemBio(pem);
  X509Ptr cert(::PEM_read_bio_X509(bio.get(), nullptr, nullptr, nullptr), ::X509_free);
  if (!cert) {
    throw std::runtime_error("Unable to parse " + std::string(what) + " PEM certificate");
  }
  return cert;
}

// Parse a PEM private key. Throws std::runtime_error naming what if it cannot be parsed.
inline PKeyPtr ReadPemPrivateKey(std::string_view pem, std::string_view what) {
  auto bio = MakeMemBio(pem);
  PKeyPtr pkey(::PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), ::EVP_PKEY_free);
  if (!pkey) {
    throw std::runtime_error("Unable to parse " + std::string(what) + " PEM private key");
  }
  return pkey;
}

}  // namespace tlsdial
