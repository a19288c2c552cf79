// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "certissuer/ds/logger.h"
#include "certissuer/issuer/issuer.h"
#include "options.h"

#include <CLI/CLI.hpp>

#ifndef CERTISSUER_VERSION
#  define CERTISSUER_VERSION "unknown"
#endif

namespace
{
  void init_logging(const certissuer::issuer::LoggingConfig& logging)
  {
    auto& loggers = certissuer::logger::config::loggers();
    loggers.clear();
    if (logging.format == certissuer::issuer::LogFormat::JSON)
    {
      certissuer::logger::config::add_json_console_logger();
    }
    else
    {
      certissuer::logger::config::add_text_console_logger();
    }
    certissuer::logger::config::level() = logging.level;
  }
}

int main(int argc, char** argv)
{
  using namespace certissuer;

  logger::config::default_init();

  CLI::App app{
    "Issues a TLS certificate signed by a certificate authority: generates a "
    "new RSA key, a certificate signing request for it and the signed "
    "certificate, and verifies the certificate against the CA.\n"};
  app.set_version_flag("--version", CERTISSUER_VERSION);

  CliArgs args;
  add_options(app, args);

  try
  {
    app.parse(argc, argv);
  }
  catch (const CLI::ParseError& e)
  {
    // --help and --version exit with 0, every usage error with 1
    return app.exit(e) == static_cast<int>(CLI::ExitCodes::Success) ? 0 : 1;
  }

  try
  {
    const auto config = resolve_config(args);
    init_logging(config.logging);

    const auto ca = issuer::load_ca_inputs(
      config.ca_key_path, config.ca_cert_path, config.ca_passphrase_file);
    issuer::SerialFile serial_file(config.serial_file);

    const auto output = issuer::issue_certificate(
      ca, config.subject, config.alt_names, config.parameters, serial_file);
    issuer::write_outputs(output, config.outputs);

    if (config.verbose)
    {
      LOG_DEBUG_FMT(
        "Issued certificate:\n{}",
        issuer::describe_certificate(output.certificate));
    }
  }
  catch (const issuer::IssueError& e)
  {
    LOG_FATAL_FMT("{} ({})", e.what(), to_string(e.kind()));
    return 1;
  }
  catch (const std::exception& e)
  {
    LOG_FATAL_FMT("{}", e.what());
    return 1;
  }

  return 0;
}
