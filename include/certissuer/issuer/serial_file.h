// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.
#pragma once

#include <string>

namespace certissuer::issuer
{
  /** The running serial number of a CA, kept in a text file in the format of
   * `openssl x509 -CAserial`: upper-case hex followed by a newline. The file
   * holds the last serial handed out.
   */
  class SerialFile
  {
  private:
    std::string path;

  public:
    explicit SerialFile(std::string path_);

    /** Serial file next to @p ca_cert_path: "ca.pem" gives "ca.srl", "ca"
     * gives "ca.srl"
     */
    static std::string default_path_for(const std::string& ca_cert_path);

    [[nodiscard]] const std::string& get_path() const
    {
      return path;
    }

    /** Allocates a serial number. Under an exclusive lock on the file, reads
     * the last serial (or picks a random one if the file does not exist or is
     * empty), increments it, and writes it back.
     * @return The allocated serial, as upper-case hex
     * @throws std::invalid_argument if the file does not hold a hex number
     * @throws std::runtime_error if the file cannot be opened, locked or
     *  written
     */
    std::string next();
  };
}
