// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "options.h"

#include "certissuer/ds/logger.h"
#include "certissuer/issuer/serial_file.h"
#include "ds/cli_helper.h"

#include <map>

namespace certissuer
{
  void add_options(CLI::App& app, CliArgs& args)
  {
    app
      .add_option(
        "-n,--cn",
        args.common_name,
        "Common name, also the first DNS subject alternative name. Printable "
        "ASCII only: give internationalised names in punycode (xn--...)")
      ->required();
    app
      .add_option(
        "-k,--key-size",
        args.key_size,
        fmt::format(
          "RSA key size in bits (default {})", issuer::default_key_size))
      ->check(CLI::PositiveNumber);
    app
      .add_option(
        "-d,--days",
        args.validity_days,
        fmt::format(
          "Validity period in days (default {})",
          issuer::default_validity_days))
      ->check(CLI::PositiveNumber);
    cli::add_digest_option(
      app,
      args.digest,
      "-m,--digest",
      "Signature digest: sha1, sha256, sha384 or sha512 (default sha256)");

    app.add_option("-C,--country", args.country, "Country (C)");
    app.add_option("-S,--state", args.state, "State or province (ST)");
    app.add_option("-L,--locality", args.locality, "Locality (L)");
    app.add_option("-O,--org", args.organization, "Organization (O)");
    app.add_option(
      "-U,--unit", args.organizational_unit, "Organizational unit (OU)");
    app.add_option("-E,--email", args.email, "Email address");

    cli::add_list_option(
      app,
      args.alt_dns,
      "-a,--alt-dns",
      "Comma-separated alternate DNS names, added after the common name");
    cli::add_ip_list_option(
      app,
      args.alt_ip,
      "-i,--alt-ip",
      "Comma-separated alternate IP addresses");

    app.add_option(
      "-s,--serial-file",
      args.serial_file,
      "CA serial file (default: CA_CERT with extension .srl)");
    app
      .add_option(
        "-p,--ca-pass-file",
        args.ca_passphrase_file,
        "File whose first line is the CA key passphrase")
      ->check(CLI::ExistingFile);
    app
      .add_option(
        "-c,--config", args.config_file, "JSON configuration file with defaults")
      ->check(CLI::ExistingFile);

    const std::map<std::string, issuer::LogFormat> log_format_options = {
      {"text", issuer::LogFormat::TEXT}, {"json", issuer::LogFormat::JSON}};
    app
      .add_option(
        "--log-format", args.log_format, "Log format: text (default) or json")
      ->transform(CLI::CheckedTransformer(log_format_options, CLI::ignore_case));

    app.add_flag(
      "-v,--verbose",
      args.verbose,
      "Debug logging, and a summary of the issued certificate");

    app.add_option("CA_KEY", args.ca_key, "CA private key (PEM)")
      ->required()
      ->check(CLI::ExistingFile);
    app.add_option("CA_CERT", args.ca_cert, "CA certificate (PEM)")
      ->required()
      ->check(CLI::ExistingFile);
    app.add_option("KEY_OUT", args.key_out, "Output path of the new key")
      ->required();
    app.add_option("CSR_OUT", args.csr_out, "Output path of the CSR")
      ->required();
    app
      .add_option("CERT_OUT", args.cert_out, "Output path of the certificate")
      ->required();
  }

  issuer::IssuerConfig resolve_config(const CliArgs& args)
  {
    issuer::ConfigFile file;
    if (args.config_file.has_value())
    {
      file = issuer::load_config_file(*args.config_file);
    }

    auto pick = [](const auto& cli, const auto& from_file) {
      return cli.has_value() ? cli : from_file;
    };

    issuer::IssuerConfig config;

    config.subject.country = pick(args.country, file.subject.country);
    config.subject.state = pick(args.state, file.subject.state);
    config.subject.locality = pick(args.locality, file.subject.locality);
    config.subject.organization =
      pick(args.organization, file.subject.organization);
    config.subject.organizational_unit =
      pick(args.organizational_unit, file.subject.organizational_unit);
    config.subject.common_name = args.common_name;
    config.subject.email = pick(args.email, file.subject.email);

    config.alt_names.dns_names =
      args.alt_dns.value_or(file.alt_names.dns_names);
    config.alt_names.ip_addresses =
      args.alt_ip.value_or(file.alt_names.ip_addresses);

    config.parameters.key_size = pick(args.key_size, file.key_size)
                                   .value_or(issuer::default_key_size);
    config.parameters.validity_days =
      pick(args.validity_days, file.validity_days)
        .value_or(issuer::default_validity_days);
    config.parameters.digest =
      pick(args.digest, file.digest).value_or(crypto::MDType::SHA256);

    config.ca_key_path = args.ca_key;
    config.ca_cert_path = args.ca_cert;
    config.ca_passphrase_file = args.ca_passphrase_file;
    config.serial_file =
      pick(args.serial_file, file.serial_file)
        .value_or(issuer::SerialFile::default_path_for(args.ca_cert));

    config.outputs = {args.key_out, args.csr_out, args.cert_out};

    config.verbose = args.verbose;
    config.logging.level = file.log_level.value_or(LoggerLevel::INFO);
    if (args.verbose && config.logging.level > LoggerLevel::DEBUG)
    {
      config.logging.level = LoggerLevel::DEBUG;
    }
    config.logging.format =
      pick(args.log_format, file.log_format).value_or(issuer::LogFormat::TEXT);

    return config;
  }
}
