#pragma once

#include <webget/downloader/downloader.hpp>

#include <string_view>
#include <vector>

namespace webget::downloader {

/**
 * Build one request attempt for an identity candidate. Pure: the result depends only on
 * the arguments, so no header state survives between attempts.
 */
HttpAttempt makeAttempt(std::string_view uri, std::string_view identity,
                        const std::vector<Header>& headers);

/**
 * Normalize a successful response head into a resource description.
 */
ResolvedResource describeResource(std::string_view originalUri, const HttpResponseHead& head,
                                  const std::optional<std::string>& explicitFileName);

} // namespace webget::downloader
