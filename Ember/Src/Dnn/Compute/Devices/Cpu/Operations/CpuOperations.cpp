#include "../../../OperationsRegistrar.h"

#include "../../../../../Utils/Logger.h"
#include "CpuActivationOp.h"
#include "CpuAttentionOp.h"
#include "CpuDropoutOp.h"
#include "CpuEncoderOp.h"
#include "CpuLayerNormOp.h"
#include "CpuLinearOp.h"
#include "CpuResidualOp.h"
#include "CpuSoftmaxCrossEntropyOp.h"

namespace Ember::Dnn::Compute
{
    void OperationsRegistrar::registerOperations()
    {
        CpuActivationOpRegistrar::registerOperations();
        CpuAttentionOpRegistrar::registerOperations();
        CpuDropoutOpRegistrar::registerOperations();
        CpuEncoderOpRegistrar::registerOperations();
        CpuLayerNormOpRegistrar::registerOperations();
        CpuLinearOpRegistrar::registerOperations();
        CpuResidualOpRegistrar::registerOperations();
        CpuSoftmaxCrossEntropyOpRegistrar::registerOperations();

        Utils::Logger::debug( "Registered CPU operations" );
    }
}
