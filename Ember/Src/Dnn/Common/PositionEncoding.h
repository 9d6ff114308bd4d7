/**
 * @file PositionEncoding.h
 * @brief Position encoding schemes supported by the embedding and attention layers.
 */

#ifndef EMBER_DNN_POSITION_ENCODING_H_
#define EMBER_DNN_POSITION_ENCODING_H_

#include <algorithm>
#include <cctype>
#include <string>

#include "Errors.h"

namespace Ember::Dnn
{
    enum class PositionEncoding
    {
        Learned,     ///< Trained (max_seq_len x C) table added to the token embedding
        Sinusoidal,  ///< Fixed sin/cos table added to the token embedding
        Rotary,      ///< No additive table; queries and keys are rotated per position
    };

    inline std::string positionEncodingToString( PositionEncoding encoding )
    {
        switch ( encoding ) {
            case PositionEncoding::Learned:    return "learned";
            case PositionEncoding::Sinusoidal: return "sinusoidal";
            case PositionEncoding::Rotary:     return "rotary";
            default:                           return "unknown";
        }
    }

    /**
     * @throws ConfigError if the name doesn't match a supported encoding
     */
    inline PositionEncoding stringToPositionEncoding( const std::string& name )
    {
        std::string lowered( name );
        std::transform( lowered.begin(), lowered.end(), lowered.begin(),
            []( unsigned char c ) { return static_cast<char>( std::tolower( c ) ); } );

        if ( lowered == "learned" )    return PositionEncoding::Learned;
        if ( lowered == "sinusoidal" ) return PositionEncoding::Sinusoidal;
        if ( lowered == "rotary" )     return PositionEncoding::Rotary;

        throw ConfigError( "Unknown position encoding: " + name + ". Available: learned, sinusoidal, rotary" );
    }
}

#endif
