#ifndef PIPELINE_ERRORS_H
#define PIPELINE_ERRORS_H

#include <stdexcept>
#include <string>

/**
 * @brief Exception hierarchy for the try-on pipeline
 *
 * - InputValidationError: rejected before the pipeline starts, never retried
 * - StageComputationError: numeric failure inside warp/blend. Not thrown today: the warp
 *   and blend engines fall back locally and report it through WarpResult::path and the
 *   BlendResult flags. Kept so collaborators can classify such failures.
 * - CollaboratorUnavailableError: an optional external model is missing, feature is skipped
 * - FatalPipelineError: anything that ends a pipeline attempt
 */
class PipelineError : public std::runtime_error
{
public:
    explicit PipelineError(const std::string &message)
        : std::runtime_error(message) {}

    virtual const char *kind() const noexcept { return "PipelineError"; }
};

class InputValidationError : public PipelineError
{
public:
    using PipelineError::PipelineError;
    const char *kind() const noexcept override { return "InputValidationError"; }
};

class StageComputationError : public PipelineError
{
public:
    using PipelineError::PipelineError;
    const char *kind() const noexcept override { return "StageComputationError"; }
};

class CollaboratorUnavailableError : public PipelineError
{
public:
    using PipelineError::PipelineError;
    const char *kind() const noexcept override { return "CollaboratorUnavailableError"; }
};

class FatalPipelineError : public PipelineError
{
public:
    using PipelineError::PipelineError;
    const char *kind() const noexcept override { return "FatalPipelineError"; }
};

#endif // PIPELINE_ERRORS_H
