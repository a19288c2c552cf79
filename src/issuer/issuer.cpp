// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "certissuer/issuer/issuer.h"

#include "certissuer/crypto/ca_key_pair.h"
#include "certissuer/crypto/extensions.h"
#include "certissuer/crypto/key_pair.h"
#include "certissuer/crypto/verifier.h"
#include "certissuer/ds/logger.h"
#include "certissuer/ds/nonstd.h"
#include "certissuer/ds/x509_time_fmt.h"
#include "crypto/certs.h"
#include "ds/files.h"

#define FMT_HEADER_ONLY
#include <chrono>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <vector>

namespace certissuer::issuer
{
  namespace
  {
    /** Runs one issuance step, turning its failure into an IssueError.
     * std::invalid_argument always means bad input, unless the step itself
     * is a check on the issued certificate.
     */
    template <typename F>
    auto run_step(const std::string& step, IssueErrorKind kind, F&& f)
      -> decltype(f())
    {
      try
      {
        LOG_DEBUG_FMT("Step: {}", step);
        return f();
      }
      catch (const IssueError&)
      {
        throw;
      }
      catch (const std::invalid_argument& e)
      {
        const auto invalid_kind = kind == IssueErrorKind::CryptoError ?
          IssueErrorKind::InvalidArgument :
          kind;
        throw IssueError(invalid_kind, step, e.what());
      }
      catch (const std::exception& e)
      {
        throw IssueError(kind, step, e.what());
      }
    }

    void check_parameters(const IssuanceParameters& params)
    {
      if (params.key_size <= 0)
      {
        throw std::invalid_argument(
          fmt::format("Key size must be positive, got {}", params.key_size));
      }
      if (params.validity_days <= 0)
      {
        throw std::invalid_argument(fmt::format(
          "Validity must be a positive number of days, got {}",
          params.validity_days));
      }
      if (params.digest == crypto::MDType::NONE)
      {
        throw std::invalid_argument("A signature digest is required");
      }
    }

    crypto::Pem read_pem(const std::string& path, const std::string& what)
    {
      try
      {
        return crypto::Pem(files::slurp_string(path));
      }
      catch (const std::invalid_argument& e)
      {
        throw std::invalid_argument(
          fmt::format("Invalid {} {}: {}", what, path, e.what()));
      }
    }
  }

  IssuanceOutput issue_certificate(
    const CAInputs& ca,
    const SubjectDescriptor& subject,
    const AlternativeNames& alternates,
    const IssuanceParameters& params,
    SerialFile& serial_file)
  {
    using Kind = IssueErrorKind;

    const auto name = run_step("subject", Kind::InvalidArgument, [&]() {
      return to_distinguished_name(subject);
    });
    LOG_DEBUG_FMT("Subject: {}", name.str());

    const auto sans =
      run_step("subject_alt_names", Kind::InvalidArgument, [&]() {
        return make_subject_alt_names(subject.common_name, alternates);
      });
    LOG_DEBUG_FMT("Subject alternative names: {}", to_indexed_string(sans));

    const auto validity =
      run_step("parameters", Kind::InvalidArgument, [&]() {
        check_parameters(params);
        const auto from = params.valid_from.has_value() ?
          ds::to_x509_time_string(*params.valid_from) :
          ds::to_x509_time_string(std::chrono::system_clock::now());
        return std::make_pair(
          from,
          crypto::compute_cert_valid_to_string(from, params.validity_days));
      });
    const auto& [valid_from, valid_to] = validity;
    LOG_DEBUG_FMT("Validity: {} to {}", valid_from, valid_to);

    const auto ca_key_pair = run_step("load_ca", Kind::InvalidArgument, [&]() {
      return crypto::make_ca_key_pair(
        ca.private_key, ca.certificate, ca.passphrase);
    });

    const auto key_pair = run_step("generate_key", Kind::CryptoError, [&]() {
      return crypto::make_rsa_key_pair(params.key_size);
    });
    LOG_DEBUG_FMT("Generated {}-bit RSA key", key_pair->key_size());

    const auto extensions = crypto::ExtensionProfile::leaf(sans);

    auto csr = run_step("create_csr", Kind::CryptoError, [&]() {
      return key_pair->create_csr(name, extensions, params.digest);
    });

    const auto serial = run_step("allocate_serial", Kind::CryptoError, [&]() {
      return serial_file.next();
    });

    auto certificate = run_step("sign", Kind::CryptoError, [&]() {
      return ca_key_pair->sign_csr(
        csr,
        serial,
        validity.first,
        validity.second,
        extensions,
        params.digest);
    });

    verify_issued_certificate(certificate, ca.certificate);

    LOG_INFO_FMT(
      "Issued certificate for {} with serial {}, valid until {}",
      subject.common_name,
      serial,
      valid_to);

    return {
      key_pair->private_key_pem(),
      std::move(csr),
      std::move(certificate),
      serial};
  }

  void verify_issued_certificate(
    const crypto::Pem& certificate, const crypto::Pem& ca_certificate)
  {
    auto verifier =
      run_step("parse_certificate", IssueErrorKind::MalformedCertificate, [&]() {
        return crypto::make_unique_verifier(certificate);
      });

    run_step("verify_chain", IssueErrorKind::ChainVerificationFailed, [&]() {
      const auto ca_certs = crypto::split_x509_cert_bundle(ca_certificate.str());
      if (ca_certs.empty())
      {
        throw std::invalid_argument("no CA certificate to verify against");
      }

      std::vector<const crypto::Pem*> trusted;
      for (const auto& ca_cert : ca_certs)
      {
        trusted.push_back(&ca_cert);
      }

      std::string reason;
      if (!verifier->verify_certificate(trusted, {}, false, &reason))
      {
        throw std::runtime_error(reason);
      }
    });
    LOG_DEBUG_FMT("Verified certificate {}", verifier->serial_number());
  }

  void write_outputs(const IssuanceOutput& output, const OutputPaths& paths)
  {
    run_step("write_outputs", IssueErrorKind::InvalidArgument, [&]() {
      // Nothing is moved into place until all three files are on disk
      std::vector<files::StagedFile> staged;
      staged.push_back(
        files::stage(output.private_key.str(), paths.private_key, 0600));
      staged.push_back(files::stage(output.csr.str(), paths.csr));
      staged.push_back(
        files::stage(output.certificate.str(), paths.certificate));

      for (auto& file : staged)
      {
        file.commit();
      }
    });
    LOG_DEBUG_FMT(
      "Wrote {}, {} and {}", paths.private_key, paths.csr, paths.certificate);
  }

  std::string describe_certificate(const crypto::Pem& certificate)
  {
    auto verifier = crypto::make_unique_verifier(certificate);
    const auto [not_before, not_after] = verifier->validity_period();

    auto with_criticality = [&verifier](
                              const std::string& extension,
                              const std::vector<std::string>& values) {
      return fmt::format(
        "{}{}",
        verifier->is_extension_critical(extension) ? "critical, " : "",
        fmt::join(values, ", "));
    };

    std::string description;
    description += fmt::format("subject: {}\n", verifier->subject());
    description += fmt::format("issuer: {}\n", verifier->issuer());
    description += fmt::format("serial: {}\n", verifier->serial_number());
    description +=
      fmt::format("validity: {} to {}\n", not_before, not_after);
    description += fmt::format(
      "subjectAltName: {}\n", to_indexed_string(verifier->subject_alt_names()));
    description += fmt::format(
      "basicConstraints: {}\n",
      with_criticality(
        "basicConstraints", {verifier->is_ca() ? "CA:TRUE" : "CA:FALSE"}));
    description += fmt::format(
      "keyUsage: {}\n", with_criticality("keyUsage", verifier->key_usage()));
    description += fmt::format(
      "extendedKeyUsage: {}\n",
      with_criticality("extendedKeyUsage", verifier->extended_key_usage()));
    description += fmt::format(
      "subjectKeyIdentifier: {}\n",
      verifier->has_subject_key_identifier() ? "present" : "absent");
    description += fmt::format(
      "authorityKeyIdentifier: {}\n",
      verifier->has_authority_key_identifier() ? "present" : "absent");
    description +=
      fmt::format("signature digest: {}\n", verifier->signature_digest());
    return description;
  }

  CAInputs load_ca_inputs(
    const std::string& key_path,
    const std::string& cert_path,
    const std::optional<std::string>& passphrase_file)
  {
    return run_step("load_ca", IssueErrorKind::InvalidArgument, [&]() {
      CAInputs ca{
        read_pem(key_path, "CA key"), read_pem(cert_path, "CA certificate")};

      if (passphrase_file.has_value())
      {
        const auto content = files::slurp_string(*passphrase_file);
        const auto first_line = std::get<0>(nonstd::split_1(content, "\n"));
        ca.passphrase = std::string(nonstd::trim(first_line, "\r"));
      }

      return ca;
    });
  }
}
