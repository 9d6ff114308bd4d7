/**
 * @file Ember.h
 * @brief Umbrella header and process-wide setup for the Ember language model core.
 */

#ifndef EMBER_EMBER_H_
#define EMBER_EMBER_H_

#include "Utils/DefaultLogger.h"
#include "Utils/Logger.h"
#include "Utils/RandomGenerator.h"
#include "Version.h"

#include "Dnn/Common/ActivationType.h"
#include "Dnn/Common/CausalMask.h"
#include "Dnn/Common/Errors.h"
#include "Dnn/Compute/DeviceType.h"
#include "Dnn/Compute/ExecutionContext.h"
#include "Dnn/Compute/OperationsRegistrar.h"
#include "Dnn/Tensors/Tensor.h"
#include "Dnn/Tensors/TensorDataType.h"
#include "Dnn/Tensors/TensorInitializers.h"

#include "Dnn/Components/Blocks/FeedForward.h"
#include "Dnn/Components/Blocks/TransformerBlock.h"
#include "Dnn/Components/Layers/CausalSelfAttention.h"
#include "Dnn/Components/Layers/Encoder.h"
#include "Dnn/Components/Layers/Linear.h"
#include "Dnn/Components/Losses/SoftmaxCrossEntropy.h"
#include "Dnn/Components/Normalization/LayerNorm.h"
#include "Dnn/Components/Regularization/Dropout.h"

#include "Dnn/Models/GptModel.h"
#include "Dnn/Models/Metrics.h"
#include "Dnn/Models/ModelConfig.h"

#include "Dnn/Generation/GenerationConfig.h"
#include "Dnn/Generation/Generator.h"
#include "Dnn/Generation/Sampling.h"

namespace Ember
{
    Version getAPIVersion();

    /**
     * @brief Installs the console logger, seeds the global RandomGenerator and registers operations.
     *
     * @param randomSeed Seed for reproducibility (0 = non-deterministic seed)
     * @param logLevel Threshold of the installed logger
     * @return True if initialization succeeded, false otherwise
     */
    bool initialize( unsigned int randomSeed = 0, Utils::LogLevel logLevel = Utils::LogLevel::Info );

    /**
     * @brief Uninstalls the logger installed by initialize().
     */
    void shutdown();
}

#endif
