#ifndef EMBER_DNN_COMPUTE_OPERATION_TYPE_H_
#define EMBER_DNN_COMPUTE_OPERATION_TYPE_H_

#include <stdexcept>
#include <string>

namespace Ember::Dnn::Compute
{
    enum class OperationType {
        ActivationOp,            ///< Elementwise activation (GELU, ReLU, Swish)
        AttentionOp,             ///< Causal multi-head scaled dot-product attention
        DropoutOp,               ///< Inverted dropout, active in training mode only
        EncoderOp,               ///< Token and position embedding lookup
        LayerNormOp,             ///< Layer normalization operation
        LinearOp,                ///< Fully connected (dense) layer operation
        ResidualOp,              ///< Residual connection operation
        SoftmaxCrossEntropyOp    ///< Fused softmax and cross entropy loss
    };

    inline std::string operationTypeToString( OperationType op ) {
        switch ( op ) {
            case OperationType::ActivationOp: return "ActivationOp";
            case OperationType::AttentionOp: return "AttentionOp";
            case OperationType::DropoutOp: return "DropoutOp";
            case OperationType::EncoderOp: return "EncoderOp";
            case OperationType::LayerNormOp: return "LayerNormOp";
            case OperationType::LinearOp: return "LinearOp";
            case OperationType::ResidualOp: return "ResidualOp";
            case OperationType::SoftmaxCrossEntropyOp: return "SoftmaxCrossEntropyOp";

            default:
                throw std::runtime_error( "Invalid OperationType." );
        }
    }
}

#endif
