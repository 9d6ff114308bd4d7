/**
 * @file ComponentConfig.h
 * @brief Base classes for component configuration objects.
 */

#ifndef EMBER_DNN_COMPONENT_CONFIG_H_
#define EMBER_DNN_COMPONENT_CONFIG_H_

#include <stdexcept>
#include <string>
#include <utility>

namespace Ember::Dnn
{
    /**
     * @brief Polymorphic configuration base passed through the operation registry.
     */
    class ComponentConfig {
    public:
        virtual ~ComponentConfig() = default;

        const std::string& getName() const { return name_; }
        bool isTraining() const { return is_training_; }

        virtual void validate() const {
            if ( name_.empty() ) {
                throw std::invalid_argument( "name cannot be empty" );
            }
        }

        virtual std::string toString() const {
            return "Name: " + name_ + "\n";
        }

    protected:
        std::string name_ = "unnamed";
        bool is_training_ = false;
    };

    /**
     * @brief Fluent setters shared by every concrete configuration.
     *
     * @tparam TDerived The concrete configuration type returned by the setters.
     */
    template<typename TDerived>
    class ComponentConfigBase : public ComponentConfig {
    public:
        TDerived& withName( std::string name ) {
            name_ = std::move( name );
            return static_cast<TDerived&>(*this);
        }

        TDerived& withTraining( bool is_training ) {
            is_training_ = is_training;
            return static_cast<TDerived&>(*this);
        }
    };
}

#endif
