// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include "certissuer/crypto/pem.h"
#include "certissuer/ds/x509_time_fmt.h"

#define FMT_HEADER_ONLY
#include <chrono>
#include <cstring>
#include <fmt/format.h>
#include <memory>
#include <openssl/asn1.h>
#include <openssl/bn.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/x509.h>
#include <openssl/x509v3.h>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace certissuer::crypto
{
  namespace OpenSSL
  {
    /*
     * Generic OpenSSL error handling
     */

    /// Returns the error string from an error code
    inline std::string error_string(unsigned long ec)
    {
      // ERR_error_string doesn't really expect the code could actually be zero
      // and uses the `static char buf[256]` which is NOT cleaned nor checked
      // if it has changed. So we use ERR_error_string_n directly.
      if (ec)
      {
        std::string err(256, '\0');
        ERR_error_string_n(ec, err.data(), err.size());
        // Remove any trailing NULs before returning
        err.resize(std::strlen(err.c_str()));
        return err;
      }
      else
      {
        return "unknown error";
      }
    }

    /// Throws if rc is not 1
    inline void CHECK1(int rc)
    {
      if (rc != 1)
      {
        unsigned long ec = ERR_get_error();
        ERR_clear_error();
        throw std::runtime_error(
          fmt::format("OpenSSL error: {}", error_string(ec)));
      }
    }

    /// Throws if rc is 0 and has error
    inline void CHECK0(int rc)
    {
      unsigned long ec = ERR_get_error();
      if (rc == 0 && ec != 0)
      {
        ERR_clear_error();
        throw std::runtime_error(
          fmt::format("OpenSSL error: {}", error_string(ec)));
      }
    }

    /// Throws if rc is not positive
    inline void CHECKPOSITIVE(int rc)
    {
      if (rc <= 0)
      {
        unsigned long ec = ERR_get_error();
        ERR_clear_error();
        throw std::runtime_error(
          fmt::format("OpenSSL error: {}", error_string(ec)));
      }
    }

    /// Throws if ptr is null
    inline void CHECKNULL(const void* ptr)
    {
      if (ptr == NULL)
      {
        unsigned long ec = ERR_get_error();
        ERR_clear_error();
        throw std::runtime_error(fmt::format(
          "OpenSSL error: missing object ({})", error_string(ec)));
      }
    }

    /*
     * Unique pointer wrappers for SSL objects, with SSL' specific constructors
     * and destructors. Some objects need special functionality, others are just
     * wrappers around the same template interface Unique_SSL_OBJECT.
     */

    /// Generic template interface for different types of objects below
    /// If there are no c-tors in the derived class that matches this one,
    /// pass `nullptr` to the CTOR/DTOR parameters and make sure to implement
    /// and delete the appropriate c-tors in the derived class.
    template <class T, T* (*CTOR)(), void (*DTOR)(T*)>
    class Unique_SSL_OBJECT
    {
    protected:
      /// Pointer owning storage
      std::unique_ptr<T, void (*)(T*)> p;

    public:
      /// C-tor with new pointer via T's c-tor
      Unique_SSL_OBJECT() : p(CTOR(), DTOR)
      {
        CHECKNULL(p.get());
      }
      /// C-tor with pointer created in base class
      Unique_SSL_OBJECT(T* ptr, void (*dtor)(T*), bool check_null = true) :
        p(ptr, dtor)
      {
        if (check_null)
          CHECKNULL(p.get());
      }
      /// Type cast to underlying pointer
      operator T*()
      {
        return p.get();
      }
      /// Type cast to underlying pointer
      operator T*() const
      {
        return p.get();
      }
      /// Reset pointer, free old if any
      void reset(T* other)
      {
        p.reset(other);
      }
      /// Release pointer, so it's freed elsewhere (CAUTION!)
      T* release()
      {
        return p.release();
      }
    };

    struct Unique_BIO : public Unique_SSL_OBJECT<BIO, nullptr, nullptr>
    {
      Unique_BIO() :
        Unique_SSL_OBJECT(BIO_new(BIO_s_mem()), [](auto x) { BIO_free(x); })
      {}
      Unique_BIO(const void* buf, int len) :
        Unique_SSL_OBJECT(
          BIO_new_mem_buf(buf, len), [](auto x) { BIO_free(x); })
      {}
      Unique_BIO(const std::vector<uint8_t>& d) :
        Unique_SSL_OBJECT(
          BIO_new_mem_buf(d.data(), d.size()), [](auto x) { BIO_free(x); })
      {}
      Unique_BIO(const Pem& pem) :
        Unique_SSL_OBJECT(
          BIO_new_mem_buf(pem.data(), -1), [](auto x) { BIO_free(x); })
      {}
    };

    /// Contents of a memory BIO
    inline std::string bio_to_string(BIO* mem)
    {
      BUF_MEM* bptr = nullptr;
      BIO_get_mem_ptr(mem, &bptr);
      return {bptr->data, bptr->length};
    }

    struct Unique_PKEY
      : public Unique_SSL_OBJECT<EVP_PKEY, EVP_PKEY_new, EVP_PKEY_free>
    {
      using Unique_SSL_OBJECT::Unique_SSL_OBJECT;
      /// Public key
      Unique_PKEY(BIO* mem) :
        Unique_SSL_OBJECT(
          PEM_read_bio_PUBKEY(mem, NULL, NULL, NULL), EVP_PKEY_free)
      {}
      /// Private key, possibly encrypted. p == nullptr is OK (e.g. wrong
      /// passphrase)
      Unique_PKEY(BIO* mem, const std::optional<std::string>& passphrase) :
        Unique_SSL_OBJECT(
          PEM_read_bio_PrivateKey(
            mem,
            NULL,
            NULL,
            passphrase.has_value() ? (void*)passphrase->c_str() : (void*)""),
          EVP_PKEY_free,
          /*check_null=*/false)
      {}
    };

    struct Unique_EVP_PKEY_CTX
      : public Unique_SSL_OBJECT<EVP_PKEY_CTX, nullptr, nullptr>
    {
      Unique_EVP_PKEY_CTX(EVP_PKEY* key) :
        Unique_SSL_OBJECT(EVP_PKEY_CTX_new(key, NULL), EVP_PKEY_CTX_free)
      {}
      Unique_EVP_PKEY_CTX(const std::string& name) :
        Unique_SSL_OBJECT(
          EVP_PKEY_CTX_new_from_name(NULL, name.c_str(), NULL),
          EVP_PKEY_CTX_free)
      {}
    };

    struct Unique_X509_REQ
      : public Unique_SSL_OBJECT<X509_REQ, X509_REQ_new, X509_REQ_free>
    {
      using Unique_SSL_OBJECT::Unique_SSL_OBJECT;
      Unique_X509_REQ(BIO* mem) :
        Unique_SSL_OBJECT(
          PEM_read_bio_X509_REQ(mem, NULL, NULL, NULL), X509_REQ_free)
      {}
    };

    struct Unique_X509 : public Unique_SSL_OBJECT<X509, X509_new, X509_free>
    {
      using Unique_SSL_OBJECT::Unique_SSL_OBJECT;
      // p == nullptr is OK (e.g. wrong format)
      Unique_X509(BIO* mem, bool pem, bool check_null = false) :
        Unique_SSL_OBJECT(
          pem ? PEM_read_bio_X509(mem, NULL, NULL, NULL) :
                d2i_X509_bio(mem, NULL),
          X509_free,
          check_null)
      {}
      Unique_X509(X509* cert, bool check_null) :
        Unique_SSL_OBJECT(cert, X509_free, check_null)
      {}
    };

    struct Unique_X509_NAME
      : public Unique_SSL_OBJECT<X509_NAME, X509_NAME_new, X509_NAME_free>
    {
      using Unique_SSL_OBJECT::Unique_SSL_OBJECT;
    };

    struct Unique_X509_STORE
      : public Unique_SSL_OBJECT<X509_STORE, X509_STORE_new, X509_STORE_free>
    {
      using Unique_SSL_OBJECT::Unique_SSL_OBJECT;
    };

    struct Unique_X509_STORE_CTX : public Unique_SSL_OBJECT<
                                     X509_STORE_CTX,
                                     X509_STORE_CTX_new,
                                     X509_STORE_CTX_free>
    {
      using Unique_SSL_OBJECT::Unique_SSL_OBJECT;
    };

    struct Unique_STACK_OF_X509
      : public Unique_SSL_OBJECT<STACK_OF(X509), nullptr, nullptr>
    {
      Unique_STACK_OF_X509() :
        Unique_SSL_OBJECT(
          sk_X509_new_null(), [](auto x) { sk_X509_pop_free(x, X509_free); })
      {}
    };

    struct Unique_X509_EXTENSION
      : public Unique_SSL_OBJECT<X509_EXTENSION, nullptr, nullptr>
    {
      Unique_X509_EXTENSION(X509_EXTENSION* ext) :
        Unique_SSL_OBJECT(ext, X509_EXTENSION_free)
      {}
    };

    struct Unique_STACK_OF_X509_EXTENSIONS
      : public Unique_SSL_OBJECT<STACK_OF(X509_EXTENSION), nullptr, nullptr>
    {
      Unique_STACK_OF_X509_EXTENSIONS() :
        Unique_SSL_OBJECT(sk_X509_EXTENSION_new_null(), [](auto x) {
          sk_X509_EXTENSION_pop_free(x, X509_EXTENSION_free);
        })
      {}
      Unique_STACK_OF_X509_EXTENSIONS(STACK_OF(X509_EXTENSION) * exts) :
        Unique_SSL_OBJECT(
          exts,
          [](auto x) { sk_X509_EXTENSION_pop_free(x, X509_EXTENSION_free); },
          /*check_null=*/false)
      {}
    };

    struct Unique_GENERAL_NAMES
      : public Unique_SSL_OBJECT<GENERAL_NAMES, nullptr, nullptr>
    {
      Unique_GENERAL_NAMES() :
        Unique_SSL_OBJECT(sk_GENERAL_NAME_new_null(), GENERAL_NAMES_free)
      {}
      // p == nullptr is OK (extension absent)
      Unique_GENERAL_NAMES(GENERAL_NAMES* names) :
        Unique_SSL_OBJECT(names, GENERAL_NAMES_free, /*check_null=*/false)
      {}
    };

    struct Unique_GENERAL_NAME
      : public Unique_SSL_OBJECT<GENERAL_NAME, GENERAL_NAME_new, GENERAL_NAME_free>
    {
      using Unique_SSL_OBJECT::Unique_SSL_OBJECT;
    };

    struct Unique_BIGNUM : public Unique_SSL_OBJECT<BIGNUM, BN_new, BN_free>
    {
      using Unique_SSL_OBJECT::Unique_SSL_OBJECT;
    };

    struct Unique_ASN1_INTEGER : public Unique_SSL_OBJECT<
                                   ASN1_INTEGER,
                                   ASN1_INTEGER_new,
                                   ASN1_INTEGER_free>
    {
      using Unique_SSL_OBJECT::Unique_SSL_OBJECT;
    };

    struct Unique_X509_TIME
      : public Unique_SSL_OBJECT<ASN1_TIME, ASN1_TIME_new, ASN1_TIME_free>
    {
      using Unique_SSL_OBJECT::Unique_SSL_OBJECT;
      Unique_X509_TIME(const std::string& s) :
        Unique_SSL_OBJECT(ASN1_TIME_new(), ASN1_TIME_free)
      {
        auto t = ds::to_x509_time_string(s);
        CHECK1(ASN1_TIME_set_string(*this, t.c_str()));
        CHECK1(ASN1_TIME_normalize(*this));
      }
      Unique_X509_TIME(ASN1_TIME* t) :
        Unique_SSL_OBJECT(t, ASN1_TIME_free, /*check_null=*/false)
      {}
      Unique_X509_TIME(const std::chrono::system_clock::time_point& t) :
        Unique_X509_TIME(ds::to_x509_time_string(t))
      {}
    };
  }
}
