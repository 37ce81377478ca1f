//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "default_config.hpp"

namespace typebind
{
namespace registry
{

const char* defaultConfigText() noexcept
{
    return R"toml(
[bindings.swift]
generate_immutable_records = true

[bindings.swift.custom_types.Uuid]
type_name = "UUID"
imports = ["Foundation"]
into_custom = "UUID(uuidString: {})!"
from_custom = "{}.uuidString"

[bindings.kotlin.custom_types.Uuid]
type_name = "UUID"
imports = ["java.util.UUID"]
into_custom = "UUID.fromString({})"
from_custom = "{}.toString()"

[bindings.python.custom_types.Uuid]
type_name = "UUID"
imports = ["uuid"]
into_custom = "uuid.UUID({})"
from_custom = "str({})"

[bindings.swift.custom_types.Url]
type_name = "URL"
imports = ["Foundation"]
into_custom = "URL(string: {})!"
from_custom = "String(describing: {})"

[bindings.kotlin.custom_types.Url]
type_name = "URL"
imports = ["java.net.URI", "java.net.URL"]
into_custom = "URI({}).toURL()"
from_custom = "{}.toString()"

# `urllib.parse.ParseResult` is used on the Python side; no annotation is needed.
[bindings.python.custom_types.Url]
imports = ["urllib.parse"]
into_custom = "urllib.parse.urlparse({})"
from_custom = "urllib.parse.urlunparse({})"

# ISO 8601 with milliseconds and a time zone offset.
[bindings.swift.custom_types.Timestamp]
type_name = "Date"
imports = ["Foundation"]
into_custom = "{let df = DateFormatter();df.dateFormat = \"yyyy-MM-dd'T'HH:mm:ss.SSSZZZZZ\";return df.date(from: {})!}()"
from_custom = "{let df = DateFormatter();df.dateFormat = \"yyyy-MM-dd'T'HH:mm:ss.SSSZZZZZ\";return df.string(from: {})}()"

[bindings.kotlin.custom_types.Timestamp]
type_name = "OffsetDateTime"
imports = ["java.time"]
into_custom = "OffsetDateTime.parse({}, DateTimeFormatter.ISO_DATE_TIME)"
from_custom = "{}.format(DateTimeFormatter.ISO_DATE_TIME)"

[bindings.python.custom_types.Timestamp]
imports = ["datetime"]
into_custom = "datetime.datetime.fromisoformat({})"
from_custom = "{}.isoformat()"
)toml";
}

}  // namespace registry
}  // namespace typebind
