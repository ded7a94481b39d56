// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SLUICE_S3_CLIENT_HPP
#define SLUICE_S3_CLIENT_HPP

#include <memory>
#include <string>

#include "credentials.hpp"
#include "output_config.hpp"
#include "output_interfaces.hpp"

namespace sluice {
namespace output {

/**
 * S3 uploader built on the AWS SDK for C++
 *
 * Works against AWS S3 and S3-compatible stores (MinIO, Ceph RGW, ...).
 * Every chunk is sent with a single PutObject request that overwrites the
 * object at the key; the SDK's own retry strategy is disabled so a failed
 * chunk surfaces immediately and retry stays with the pipeline's resume.
 *
 * Construction resolves credentials once (see resolveCredentials()) and
 * checks access to the bucket with a HeadBucket request.
 */
class S3Client : public IObjectUploader {
public:
  /**
   * @param config Output configuration (bucket, endpoint, region, credentials)
   * @param env Environment lookup used for credential resolution
   * @throws ConfigurationError on a half-configured key pair
   * @throws AuthenticationError if the bucket cannot be accessed
   */
  explicit S3Client(const OutputConfig& config, const EnvLookup& env = systemEnv);
  ~S3Client() override;

  // Non-copyable, non-movable
  S3Client(const S3Client&) = delete;
  S3Client& operator=(const S3Client&) = delete;
  S3Client(S3Client&&) = delete;
  S3Client& operator=(S3Client&&) = delete;

  /**
   * Upload a complete local file to bucket/key, replacing any existing object.
   *
   * @return UploadResult with the ETag on success, or the error code and a
   *         retryable classification on failure
   */
  UploadResult uploadFile(const std::string& local_path, const std::string& key) override;

  /**
   * Check if an S3 error code denotes a transient failure
   */
  static bool isRetryableError(const std::string& error_code);

  const std::string& bucket() const;

  const std::string& endpoint() const;

  const CredentialSource& credentialSource() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace output
}  // namespace sluice

#endif  // SLUICE_S3_CLIENT_HPP
