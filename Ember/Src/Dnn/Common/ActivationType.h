/**
 * @file ActivationType.h
 * @brief Definition of the activation function types supported by the feed-forward block.
 */

#ifndef EMBER_DNN_ACTIVATION_TYPE_H_
#define EMBER_DNN_ACTIVATION_TYPE_H_

#include <algorithm>
#include <cctype>
#include <string>

#include "Errors.h"

namespace Ember::Dnn
{
    /**
     * @brief Enumeration of supported activation function types.
     */
    enum class ActivationType
    {
        Gelu,       ///< Gaussian Error Linear Unit: x * phi(x) where phi() is the standard Gaussian CDF
        Relu,       ///< Rectified Linear Unit: max(0, x)
        Swish,      ///< Sigmoid Linear Unit: x * sigmoid(x)
    };

    /**
     * @brief Converts an ActivationType enum value to its configuration name.
     */
    inline std::string activationTypeToString( ActivationType type )
    {
        switch ( type ) {
            case ActivationType::Gelu:  return "gelu";
            case ActivationType::Relu:  return "relu";
            case ActivationType::Swish: return "swish";
            default:                    return "unknown";
        }
    }

    /**
     * @brief Converts a configuration name to its ActivationType.
     *
     * Matching is case-insensitive.
     *
     * @throws ConfigError if the name doesn't match a supported activation function
     */
    inline ActivationType stringToActivationType( const std::string& name )
    {
        std::string lowered( name );
        std::transform( lowered.begin(), lowered.end(), lowered.begin(),
            []( unsigned char c ) { return static_cast<char>( std::tolower( c ) ); } );

        if ( lowered == "gelu" )  return ActivationType::Gelu;
        if ( lowered == "relu" )  return ActivationType::Relu;
        if ( lowered == "swish" ) return ActivationType::Swish;

        throw ConfigError( "Unknown activation: " + name + ". Available: gelu, relu, swish" );
    }
}

#endif
