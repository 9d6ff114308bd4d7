/**
 * @file OperationRegistry.h
 * @brief Central registry for creating and discovering compute operations.
 */

#ifndef EMBER_DNN_COMPUTE_OPERATION_REGISTRY_H_
#define EMBER_DNN_COMPUTE_OPERATION_REGISTRY_H_

#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include <fmt/format.h>

#include "../../Common/ComponentConfig.h"
#include "../../Tensors/TensorDataType.h"
#include "../DeviceType.h"
#include "../ExecutionContext.h"
#include "BinaryOperation.h"
#include "UnaryOperation.h"

namespace Ember::Dnn::Compute
{
    /**
     * @brief A registry for operations using abstract tensor data types.
     *
     * Stores factory functions for concrete, typed operations. Factories are
     * registered per (DeviceType, input types, compute precision) and operation name.
     */
    class OperationRegistry
    {
    public:

        /**
         * @brief Composite key for registry lookup.
         *
         * For unary operations the second data_type equals the input type.
         */
        struct TypeID
        {
            DeviceType device_type;
            TensorDataType data_type_a;
            TensorDataType data_type_b;
            TensorDataType compute_precision;

            bool operator==( const TypeID& other ) const
            {
                return device_type == other.device_type &&
                    data_type_a == other.data_type_a &&
                    data_type_b == other.data_type_b &&
                    compute_precision == other.compute_precision;
            }
        };

        struct TypeIDHash
        {
            std::size_t operator()( const TypeID& id ) const
            {
                std::size_t seed = std::hash<int>{}(static_cast<int>(id.device_type));
                seed ^= (std::hash<int>{}(static_cast<int>(id.data_type_a)) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
                seed ^= (std::hash<int>{}(static_cast<int>(id.data_type_b)) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
                seed ^= (std::hash<int>{}(static_cast<int>(id.compute_precision)) + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2));
                return seed;
            }
        };

        static OperationRegistry& instance()
        {
            static OperationRegistry registry;
            return registry;
        }

        /**
         * @brief Register a unary operation creator.
         */
        template<DeviceType TDeviceType, TensorDataType TInputType, TensorDataType TComputePrecision = TInputType>
        void registerUnaryOperation(
            const std::string& operation_name,
            std::function<std::shared_ptr<UnaryOperation<TDeviceType, TInputType, TComputePrecision>>(
                std::shared_ptr<ExecutionContext<TDeviceType>>,
                const ComponentConfig& )> creator )
        {
            TypeID type_id{ TDeviceType, TInputType, TInputType, TComputePrecision };
            registry_[ type_id ][ operation_name ] = makeGenericCreator<TDeviceType>( std::move( creator ) );
        }

        /**
         * @brief Register a binary operation creator.
         */
        template<DeviceType TDeviceType, TensorDataType TInputA, TensorDataType TInputB = TInputA,
            TensorDataType TComputePrecision = TInputA>
        void registerBinaryOperation(
            const std::string& operation_name,
            std::function<std::shared_ptr<BinaryOperation<TDeviceType, TInputA, TInputB, TComputePrecision>>(
                std::shared_ptr<ExecutionContext<TDeviceType>>,
                const ComponentConfig& )> creator )
        {
            TypeID type_id{ TDeviceType, TInputA, TInputB, TComputePrecision };
            registry_[ type_id ][ operation_name ] = makeGenericCreator<TDeviceType>( std::move( creator ) );
        }

        /**
         * @brief Create a unary operation instance.
         *
         * @throws std::runtime_error If no operation is registered under the name and types
         */
        template<DeviceType TDeviceType, TensorDataType TInputType, TensorDataType TComputePrecision = TInputType>
        std::shared_ptr<UnaryOperation<TDeviceType, TInputType, TComputePrecision>> createUnaryOperation(
            const std::string& operation_name,
            std::shared_ptr<ExecutionContext<TDeviceType>> context,
            const ComponentConfig& config ) const
        {
            TypeID type_id{ TDeviceType, TInputType, TInputType, TComputePrecision };
            const auto& creator = findCreator( type_id, operation_name, "createUnaryOperation" );

            if (!context)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null when creating an operation" );
            }

            return std::static_pointer_cast<UnaryOperation<TDeviceType, TInputType, TComputePrecision>>(
                creator( std::static_pointer_cast<IExecutionContext>(context), config ) );
        }

        /**
         * @brief Create a binary operation instance.
         */
        template<DeviceType TDeviceType, TensorDataType TInputA, TensorDataType TInputB = TInputA,
            TensorDataType TComputePrecision = TInputA>
        std::shared_ptr<BinaryOperation<TDeviceType, TInputA, TInputB, TComputePrecision>> createBinaryOperation(
            const std::string& operation_name,
            std::shared_ptr<ExecutionContext<TDeviceType>> context,
            const ComponentConfig& config ) const
        {
            TypeID type_id{ TDeviceType, TInputA, TInputB, TComputePrecision };
            const auto& creator = findCreator( type_id, operation_name, "createBinaryOperation" );

            if (!context)
            {
                throw std::invalid_argument( "ExecutionContext cannot be null when creating an operation" );
            }

            return std::static_pointer_cast<BinaryOperation<TDeviceType, TInputA, TInputB, TComputePrecision>>(
                creator( std::static_pointer_cast<IExecutionContext>(context), config ) );
        }

        /**
         * @brief Get list of registered operation names for a given type configuration.
         */
        template<DeviceType TDeviceType, TensorDataType TInputA, TensorDataType TInputB = TInputA,
            TensorDataType TComputePrecision = TInputA>
        std::vector<std::string> getRegisteredOperations() const
        {
            TypeID type_id{ TDeviceType, TInputA, TInputB, TComputePrecision };
            auto type_it = registry_.find( type_id );
            if (type_it == registry_.end()) return {};

            std::vector<std::string> operations;
            operations.reserve( type_it->second.size() );
            for (const auto& [name, _] : type_it->second) operations.push_back( name );

            return operations;
        }

        template<DeviceType TDeviceType, TensorDataType TInputA, TensorDataType TInputB = TInputA,
            TensorDataType TComputePrecision = TInputA>
        bool isOperationRegistered( const std::string& operation_name ) const
        {
            TypeID type_id{ TDeviceType, TInputA, TInputB, TComputePrecision };
            auto type_it = registry_.find( type_id );
            if (type_it == registry_.end()) return false;
            return type_it->second.find( operation_name ) != type_it->second.end();
        }

    private:
        using GenericCreator = std::function<std::shared_ptr<void>(
            std::shared_ptr<IExecutionContext>,
            const ComponentConfig& )>;

        std::unordered_map<TypeID, std::unordered_map<std::string, GenericCreator>, TypeIDHash> registry_;

        OperationRegistry() = default;
        OperationRegistry( const OperationRegistry& ) = delete;
        OperationRegistry& operator=( const OperationRegistry& ) = delete;

        template<DeviceType TDeviceType, typename TCreator>
        static GenericCreator makeGenericCreator( TCreator creator )
        {
            return [creator = std::move( creator )](
                std::shared_ptr<IExecutionContext> ictx,
                const ComponentConfig& config ) -> std::shared_ptr<void> {

                    if (!ictx)
                    {
                        throw std::invalid_argument( "ExecutionContext cannot be null when creating an operation" );
                    }

                    if (ictx->getDeviceType() != TDeviceType)
                    {
                        throw std::runtime_error( "ExecutionContext device type does not match the registered operation." );
                    }

                    auto ctx = std::static_pointer_cast<ExecutionContext<TDeviceType>>(ictx);
                    return creator( ctx, config );
                };
        }

        const GenericCreator& findCreator( const TypeID& type_id, const std::string& operation_name, const char* caller ) const
        {
            auto type_it = registry_.find( type_id );

            if (type_it == registry_.end())
            {
                throw std::runtime_error( fmt::format(
                    "{}: No operations registered for Device: {}, InputTypes: ({}, {}), ComputePrecision: {}",
                    caller,
                    deviceTypeToString( type_id.device_type ),
                    tensorDataTypeToString( type_id.data_type_a ),
                    tensorDataTypeToString( type_id.data_type_b ),
                    tensorDataTypeToString( type_id.compute_precision ) ) );
            }

            auto op_it = type_it->second.find( operation_name );

            if (op_it == type_it->second.end())
            {
                throw std::runtime_error( fmt::format(
                    "{}: Operation '{}' not found for Device: {}, InputTypes: ({}, {}), ComputePrecision: {}",
                    caller,
                    operation_name,
                    deviceTypeToString( type_id.device_type ),
                    tensorDataTypeToString( type_id.data_type_a ),
                    tensorDataTypeToString( type_id.data_type_b ),
                    tensorDataTypeToString( type_id.compute_precision ) ) );
            }

            return op_it->second;
        }
    };
}

#endif
