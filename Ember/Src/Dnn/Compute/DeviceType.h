/**
 * @file DeviceType.h
 * @brief Compute device enumeration.
 */

#ifndef EMBER_DNN_COMPUTE_DEVICE_TYPE_H_
#define EMBER_DNN_COMPUTE_DEVICE_TYPE_H_

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <string>

namespace Ember::Dnn::Compute
{
    enum class DeviceType {
        Cpu,    ///< CPU device type
    };

    inline std::string deviceTypeToString( DeviceType device_type ) {
        switch ( device_type ) {
            case DeviceType::Cpu: return "CPU";
            default:
                throw std::runtime_error( "Invalid DeviceType." );
        }
    }

    inline DeviceType toDeviceType( std::string device_type ) {
        std::transform( device_type.begin(), device_type.end(), device_type.begin(),
            []( unsigned char c ) { return static_cast<char>( std::toupper( c ) ); } );

        if ( device_type == "CPU" ) {
            return DeviceType::Cpu;
        }

        throw std::runtime_error(
            "Invalid compute type '" + device_type + "'. Valid options are: CPU" );
    }
}

#endif
