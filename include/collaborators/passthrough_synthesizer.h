#ifndef PASSTHROUGH_SYNTHESIZER_H
#define PASSTHROUGH_SYNTHESIZER_H

#include "core/collaborators.h"

// Returns the reference composite unchanged; used for dry runs without a generative model
class CompositePassthroughSynthesizer : public GenerativeSynthesizer
{
public:
    cv::Mat generate(const cv::Mat &composite, const cv::Mat &mask,
                     const SynthesisConditioning &conditioning,
                     const SynthesisParams &params) override;
};

#endif // PASSTHROUGH_SYNTHESIZER_H
