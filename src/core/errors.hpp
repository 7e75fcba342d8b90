#pragma once

#include <stdexcept>
#include <string>

namespace osintpipe {

class PipelineError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Backing queue database unreachable or not writable. Producers buffer and retry.
class QueueUnavailable : public PipelineError {
public:
    using PipelineError::PipelineError;
};

class StoreUnavailable : public PipelineError {
public:
    using PipelineError::PipelineError;
};

// An enrichment sub-service answered with an error or an unusable payload.
class ServiceError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

class TimeoutError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

// Every enabled enrichment step failed; the attempt as a whole is retried.
class TotalEnrichmentFailure : public PipelineError {
public:
    using PipelineError::PipelineError;
};

class MediaFetchError : public PipelineError {
public:
    using PipelineError::PipelineError;
};

}  // namespace osintpipe
