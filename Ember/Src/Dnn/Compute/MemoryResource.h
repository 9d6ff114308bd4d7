/**
 * @file MemoryResource.h
 * @brief Polymorphic memory resources backing tensor storage.
 */

#ifndef EMBER_DNN_COMPUTE_MEMORY_RESOURCE_H_
#define EMBER_DNN_COMPUTE_MEMORY_RESOURCE_H_

#include <cstddef>
#include <cstdlib>
#include <memory_resource>
#include <new>

#include "DeviceType.h"

namespace Ember::Dnn::Compute
{
    /**
     * @brief Base class of every tensor memory resource.
     */
    class MemoryResource : public std::pmr::memory_resource {
    };

    /**
     * @brief Host memory, aligned for vectorized kernels.
     */
    class CpuMemoryResource : public MemoryResource {
    public:
        static constexpr DeviceType device_type = DeviceType::Cpu;
        static constexpr bool is_host_accessible = true;

    protected:
        void* do_allocate( std::size_t n, std::size_t alignment ) override {
            if ( n == 0 ) {
                return nullptr;
            }

            // aligned_alloc requires the size to be a multiple of the alignment
            std::size_t rounded = ((n + alignment - 1) / alignment) * alignment;
            void* ptr = std::aligned_alloc( alignment, rounded );

            if ( !ptr ) {
                throw std::bad_alloc();
            }
            return ptr;
        }

        void do_deallocate( void* ptr, std::size_t, std::size_t ) override {
            std::free( ptr );
        }

        bool do_is_equal( const std::pmr::memory_resource& other ) const noexcept override {
            return this == &other;
        }
    };
}

#endif
