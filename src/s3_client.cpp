#include "objfs/s3_client.hpp"
#include "objfs/settings.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/client/DefaultRetryStrategy.h>
#include <aws/core/http/HttpResponse.h>
#include <aws/core/utils/logging/LogLevel.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/GetObjectRequest.h>
#include <aws/s3/model/HeadObjectRequest.h>
#include <fmt/format.h>
#include <glog/logging.h>

namespace objfs {

namespace {

// Maps an SDK error onto the data path's error kinds.
Status ClassifyError(const Aws::Client::AWSError<Aws::S3::S3Errors>& err, const std::string& key) {
    std::string msg = fmt::format("{}: {} ({})", key, err.GetMessage().c_str(),
                                  err.GetExceptionName().c_str());
    switch (err.GetResponseCode()) {
        case Aws::Http::HttpResponseCode::PRECONDITION_FAILED:
            return Status::ObjectChanged(msg);
        case Aws::Http::HttpResponseCode::NOT_FOUND:
        case Aws::Http::HttpResponseCode::REQUESTED_RANGE_NOT_SATISFIABLE:
            return Status::NotFound(msg);
        case Aws::Http::HttpResponseCode::FORBIDDEN:
        case Aws::Http::HttpResponseCode::UNAUTHORIZED:
            return Status::PermissionDenied(msg);
        default:
            break;
    }
    switch (err.GetErrorType()) {
        case Aws::S3::S3Errors::NO_SUCH_KEY:
        case Aws::S3::S3Errors::NO_SUCH_BUCKET:
        case Aws::S3::S3Errors::RESOURCE_NOT_FOUND:
            return Status::NotFound(msg);
        case Aws::S3::S3Errors::ACCESS_DENIED:
        case Aws::S3::S3Errors::INVALID_ACCESS_KEY_ID:
        case Aws::S3::S3Errors::SIGNATURE_DOES_NOT_MATCH:
            return Status::PermissionDenied(msg);
        default:
            break;
    }
    // Timeouts, throttling, 5xx and network failures
    return Status::Transient(msg);
}

} // namespace

// PIMPL for hiding AWS SDK headers
struct S3Client::S3ClientImpl {
    Aws::SDKOptions aws_options;
    std::unique_ptr<Aws::S3::S3Client> s3;
    std::string bucket;
};

S3Client::S3Client(const Config& cfg) : p_impl(std::make_unique<S3ClientImpl>()) {
    Config config = cfg;
    ApplyConfigDefaults(config);

    p_impl->aws_options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Fatal;
    Aws::InitAPI(p_impl->aws_options);

    Aws::Client::ClientConfiguration aws_cfg;
    if (!config.s3_region.empty()) {
        aws_cfg.region = config.s3_region;
    }
    if (!config.s3_endpoint.empty()) {
        aws_cfg.endpointOverride = config.s3_endpoint;
    }
    aws_cfg.maxConnections = config.max_concurrent_fetches;
    aws_cfg.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>("objfs", 0);

    Aws::Auth::AWSCredentials creds;
    if (!config.aws_access_key_id.empty() && !config.aws_secret_access_key.empty()) {
        creds.SetAWSAccessKeyId(config.aws_access_key_id.c_str());
        creds.SetAWSSecretKey(config.aws_secret_access_key.c_str());
    }

    // The AWS C++ SDK uses 'useVirtualAddressing'. Path style is the inverse.
    bool useVirtualAddressing = !config.s3_use_path_style;

    p_impl->s3 = std::make_unique<Aws::S3::S3Client>(creds, aws_cfg,
        Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
        useVirtualAddressing);

    p_impl->bucket = config.s3_bucket;
    LOG(INFO) << fmt::format("S3 client ready: endpoint={} bucket={}",
                             config.s3_endpoint, config.s3_bucket);
}

S3Client::~S3Client() {
    p_impl->s3.reset();
    Aws::ShutdownAPI(p_impl->aws_options);
}

Status S3Client::GetObjectRange(const std::string& key,
                                std::uint64_t offset,
                                std::uint64_t length,
                                const std::string& if_match,
                                RangeResponse* out) {
    if (length == 0) {
        out->bytes.clear();
        out->etag = if_match;
        return Status::OK();
    }

    Aws::S3::Model::GetObjectRequest request;
    request.SetBucket(p_impl->bucket);
    request.SetKey(key);
    // HTTP ranges are inclusive on both ends
    request.SetRange(fmt::format("bytes={}-{}", offset, offset + length - 1));
    if (!if_match.empty()) {
        request.SetIfMatch(if_match);
    }

    auto outcome = p_impl->s3->GetObject(request);
    if (!outcome.IsSuccess()) {
        Status st = ClassifyError(outcome.GetError(), key);
        VLOG(3) << "GetObject failed: " << st.ToString();
        return st;
    }

    auto& result = outcome.GetResult();
    out->etag = result.GetETag().c_str();

    auto& body = result.GetBody();
    std::uint64_t expected = static_cast<std::uint64_t>(result.GetContentLength());
    out->bytes.resize(expected);
    body.read(reinterpret_cast<char*>(out->bytes.data()), static_cast<std::streamsize>(expected));
    std::uint64_t got = static_cast<std::uint64_t>(body.gcount());
    if (got != expected) {
        return Status::Transient(fmt::format("{}: body truncated at {} of {} bytes", key, got, expected));
    }
    return Status::OK();
}

Status S3Client::HeadObject(const std::string& key, ObjectId* out) {
    Aws::S3::Model::HeadObjectRequest request;
    request.SetBucket(p_impl->bucket);
    request.SetKey(key);

    auto outcome = p_impl->s3->HeadObject(request);
    if (!outcome.IsSuccess()) {
        return ClassifyError(outcome.GetError(), key);
    }

    const auto& result = outcome.GetResult();
    out->key = key;
    out->size = static_cast<std::uint64_t>(result.GetContentLength());
    out->etag = result.GetETag().c_str();
    return Status::OK();
}

} // namespace objfs
