#ifndef EMBER_DNN_COMPUTE_OPERATIONS_REGISTRAR_H_
#define EMBER_DNN_COMPUTE_OPERATIONS_REGISTRAR_H_

namespace Ember::Dnn::Compute
{
    /**
     * @brief Registers every built-in operation with the OperationRegistry.
     *
     * Components call instance() before creating their operations. Registration
     * runs exactly once, on the first call, from the constructor of the
     * function-local singleton.
     */
    class OperationsRegistrar {
    public:
        static OperationsRegistrar& instance() {
            static OperationsRegistrar instance;
            return instance;
        }

        OperationsRegistrar( const OperationsRegistrar& ) = delete;
        OperationsRegistrar& operator=( const OperationsRegistrar& ) = delete;

    private:
        OperationsRegistrar() {
            registerOperations();
        }

        /**
         * @brief Defined with the CPU operations in CpuOperations.cpp.
         */
        static void registerOperations();
    };
}

#endif
