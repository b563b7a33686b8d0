#include "collaborators/passthrough_synthesizer.h"
#include <QDebug>

cv::Mat CompositePassthroughSynthesizer::generate(const cv::Mat &composite, const cv::Mat &mask,
                                                  const SynthesisConditioning &conditioning,
                                                  const SynthesisParams &params)
{
    qDebug() << "CompositePassthroughSynthesizer: Skipping generation |" << params.numInferenceSteps << "steps"
             << "| mask pixels" << cv::countNonZero(mask)
             << "| identity conditioning" << conditioning.identityEmbedding.has_value();
    return composite.clone();
}
