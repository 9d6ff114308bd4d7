/**
 * @file Component.h
 * @brief Abstract base for device-templated neural network components.
 */

#ifndef EMBER_DNN_COMPONENT_H_
#define EMBER_DNN_COMPONENT_H_

#include <atomic>
#include <memory>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "../Compute/ComputeDevice.h"
#include "../Compute/DeviceType.h"
#include "../Tensors/ITensor.h"
#include "../Tensors/TensorDataType.h"

namespace Ember::Dnn
{
    using namespace Ember::Dnn::Compute;

    /**
     * @brief Abstract base class for all components (layers, blocks, losses).
     *
     * Components own their parameter tensors and dispatch arithmetic to
     * operations obtained from the OperationRegistry. The lifecycle is
     * construct, build( max_input_shape ), then any number of const forward calls
     * with inputs no larger than the built shape.
     *
     * Parameters are reported with dotted names relative to the component
     * ("weight", "bias", "attn.qkv.weight"), so a composite can prefix the names
     * of its children.
     *
     * @tparam TDeviceType Device the component runs on
     * @tparam TPrecision Abstract tensor precision
     */
    template<DeviceType TDeviceType, TensorDataType TPrecision>
        requires PrecisionSupportedOnDevice<TPrecision, TDeviceType>
    class Component
    {
    public:
        using NamedParameter = std::pair<std::string, ITensor*>;

        virtual ~Component() = default;

        // ====================================================================
        // Lifecycle
        // ====================================================================

        bool isBuilt() const
        {
            return is_built_;
        }

        /**
         * @brief Validate and bind operations for the largest input shape.
         *
         * Building twice is a no-op.
         */
        void build( const shape_t& input_shape )
        {
            if (is_built_)
            {
                return;
            }

            onBuilding( input_shape );
            is_built_ = true;
        }

        // ====================================================================
        // Parameters
        // ====================================================================

        virtual std::vector<NamedParameter> getNamedParameters() const = 0;

        std::vector<ITensor*> getParameters() const
        {
            std::vector<ITensor*> params;
            for (const auto& [name, tensor] : getNamedParameters())
            {
                params.push_back( tensor );
            }
            return params;
        }

        virtual size_t parameterCount() const
        {
            size_t count = 0;
            for (const auto& [name, tensor] : getNamedParameters())
            {
                count += tensor->size();
            }
            return count;
        }

        // ====================================================================
        // Training mode
        // ====================================================================

        void setTraining( bool is_training )
        {
            std::lock_guard<std::mutex> lk( training_mutex_ );

            if (is_training_.load() == is_training)
            {
                return;
            }

            bool prev = is_training_.load();
            is_training_.store( is_training );

            try
            {
                onTrainingChanging( is_training );
            }
            catch (...)
            {
                is_training_.store( prev );
                throw;
            }
        }

        bool isTraining() const
        {
            return is_training_.load();
        }

        // ====================================================================
        // Identity
        // ====================================================================

        virtual std::string getName() const = 0;

        static constexpr DeviceType getDeviceType()
        {
            return TDeviceType;
        }

        static constexpr TensorDataType getPrecision() noexcept
        {
            return TPrecision;
        }

        virtual std::shared_ptr<ComputeDevice> getDevice() const = 0;

        virtual std::string toString() const = 0;

        friend std::ostream& operator<<( std::ostream& os, const Component& component )
        {
            os << component.toString();
            return os;
        }

    protected:
        /**
         * @brief Hook for derived classes to validate shapes and build operations and children.
         */
        virtual void onBuilding( const shape_t& input_shape ) = 0;

        /**
         * @brief Hook invoked when the training mode changes; propagate to ops and children here.
         */
        virtual void onTrainingChanging( [[maybe_unused]] bool is_training )
        {
        }

        void ensureBuilt( const char* caller ) const
        {
            if (!is_built_)
            {
                throw std::runtime_error( std::string( caller ) + ": component must be built before forward" );
            }
        }

        static std::vector<NamedParameter> prefixed( const std::string& prefix, std::vector<NamedParameter> params )
        {
            for (auto& [name, tensor] : params)
            {
                name = prefix + "." + name;
            }
            return params;
        }

    private:
        bool is_built_{ false };
        std::atomic<bool> is_training_{ false };
        std::mutex training_mutex_;
    };
}

#endif
