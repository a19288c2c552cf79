// Copyright (c) Microsoft Corporation. All rights reserved.
// Licensed under the Apache 2.0 License.

#include "certissuer/issuer/subject.h"

#include <stdexcept>

namespace certissuer::issuer
{
  crypto::DistinguishedName to_distinguished_name(
    const SubjectDescriptor& subject)
  {
    if (subject.common_name.empty())
    {
      throw std::invalid_argument("Common name must not be empty");
    }

    crypto::DistinguishedName name;
    auto add_optional = [&name](
                          const char* attribute,
                          const std::optional<std::string>& value) {
      if (value.has_value() && !value->empty())
      {
        name.add(attribute, *value);
      }
    };

    add_optional("C", subject.country);
    add_optional("ST", subject.state);
    add_optional("L", subject.locality);
    add_optional("O", subject.organization);
    add_optional("OU", subject.organizational_unit);
    name.add("CN", subject.common_name);
    add_optional("emailAddress", subject.email);

    return name;
  }
}
