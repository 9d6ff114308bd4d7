/**
 * @file Tensor.h
 * @brief Device-aware N-dimensional tensor.
 */

#ifndef EMBER_DNN_TENSOR_H_
#define EMBER_DNN_TENSOR_H_

#include <algorithm>
#include <atomic>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <initializer_list>
#include <memory>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <fmt/format.h>

#include "../Compute/ComputeDevice.h"
#include "../Compute/DeviceType.h"
#include "../Compute/MemoryResource.h"
#include "ITensor.h"
#include "TensorDataType.h"

namespace Ember::Dnn
{
    /**
     * @brief Thread-safe source of tensor identifiers.
     */
    class UniqueIdGenerator {
    public:
        static size_t getNextId() {
            return counter_.fetch_add( 1, std::memory_order_relaxed );
        }

    private:
        inline static std::atomic<size_t> counter_{ 0 };
    };

    template<TensorDataType TDataType, typename TMemoryResource>
    concept isValidTensor =
        std::derived_from<TMemoryResource, Compute::MemoryResource> && TMemoryResource::is_host_accessible;

    /**
     * @brief Device-aware N-dimensional tensor.
     *
     * The tensor is move-only to prevent accidental expensive copies; use clone()
     * for an explicit deep copy. Storage is owned by the tensor and allocated
     * from TMemoryResource with the element type's alignment.
     *
     * Tensor dimensionality:
     * - Scalar (rank 0): shape {}, size 1
     * - Vector (rank 1): shape {n}, size n
     * - Higher-rank: shape {d1, d2, ...}, size = product of dimensions
     *
     * Parameters shared between components (e.g. a tied embedding and output
     * projection) are held through std::shared_ptr<Tensor>, so every holder
     * observes the same storage.
     *
     * @tparam TDataType Abstract tensor data type
     * @tparam TMemoryResource Memory resource defining where storage lives
     */
    template<TensorDataType TDataType, typename TMemoryResource>
        requires isValidTensor<TDataType, TMemoryResource>
    class Tensor : public ITensor
    {
    public:
        using DataTypeTraits = TensorDataTypeTraits<TDataType>;
        using MemoryResource = TMemoryResource;
        using host_value_t = typename DataTypeTraits::host_type;

        // ====================================================================
        // Construction, Assignment, and Destruction
        // ====================================================================

        /**
         * @brief Creates a zero-initialized tensor on a compute device.
         *
         * @throws std::invalid_argument If device is null, of the wrong type, or
         *         the shape has a negative extent
         */
        explicit Tensor( std::shared_ptr<Compute::ComputeDevice> device, const shape_t& shape )
            : device_( validateDevice( std::move( device ) ) ), uid_( makeUId() ), shape_( shape ),
            size_( computeSize( shape ) ) {

            allocateBuffer();
        }

        Tensor( const Tensor& other ) = delete;
        Tensor& operator=( const Tensor& other ) = delete;

        Tensor( Tensor&& other ) noexcept
            : device_( std::move( other.device_ ) ),
            uid_( std::move( other.uid_ ) ),
            name_( std::move( other.name_ ) ),
            shape_( std::move( other.shape_ ) ),
            size_( other.size_ ),
            buffer_( std::move( other.buffer_ ) ) {

            other.size_ = 0;
            other.shape_ = {};
        }

        Tensor& operator=( Tensor&& other ) noexcept {
            if (this != &other)
            {
                device_ = std::move( other.device_ );
                uid_ = std::move( other.uid_ );
                name_ = std::move( other.name_ );
                shape_ = std::move( other.shape_ );
                size_ = other.size_;
                buffer_ = std::move( other.buffer_ );

                other.size_ = 0;
                other.shape_.clear();
            }
            return *this;
        }

        ~Tensor() override = default;

        /**
         * @brief Deep copy with a fresh identity and the same name.
         */
        Tensor clone() const {
            Tensor copy( device_, shape_ );
            copy.name_ = name_;
            if (size_ > 0)
            {
                std::memcpy( copy.data(), data(), size_ * sizeof( host_value_t ) );
            }
            return copy;
        }

        // ====================================================================
        // Type and device information
        // ====================================================================

        TensorDataType getDataType() const override {
            return TDataType;
        }

        std::string getDataTypeName() const override {
            return DataTypeTraits::type_name;
        }

        size_t elementSize() const override {
            return DataTypeTraits::size_in_bytes;
        }

        std::shared_ptr<Compute::ComputeDevice> getDevice() const override {
            return device_;
        }

        Compute::DeviceType getDeviceType() const override {
            return TMemoryResource::device_type;
        }

        // ====================================================================
        // Shape
        // ====================================================================

        const shape_t& shape() const override {
            return shape_;
        }

        size_t size() const override {
            return size_;
        }

        size_t rank() const {
            return shape_.size();
        }

        bool empty() const {
            return size_ == 0;
        }

        bool isScalar() const noexcept {
            return shape_.empty() && size_ == 1;
        }

        /**
         * @brief Changes the shape without touching the data.
         *
         * @throws std::invalid_argument If the element count differs
         */
        void reshape( const shape_t& new_shape ) {
            size_t new_size = computeSize( new_shape );
            if (new_size != size_)
            {
                throw std::invalid_argument( fmt::format(
                    "Tensor::reshape: new shape has {} elements, tensor has {}", new_size, size_ ) );
            }
            shape_ = new_shape;
        }

        // ====================================================================
        // Data access
        // ====================================================================

        host_value_t* data() {
            return buffer_.get();
        }

        const host_value_t* data() const {
            return buffer_.get();
        }

        void* rawData() override {
            return buffer_.get();
        }

        const void* rawData() const override {
            return buffer_.get();
        }

        /**
         * @brief Bounds-checked multi-dimensional element access.
         */
        template<typename... Indices>
            requires (std::convertible_to<Indices, int64_t> && ...)
        host_value_t& operator[]( Indices... indices ) {
            return buffer_.get()[ flatIndex( { static_cast<int64_t>(indices)... } ) ];
        }

        template<typename... Indices>
            requires (std::convertible_to<Indices, int64_t> && ...)
        const host_value_t& operator[]( Indices... indices ) const {
            return buffer_.get()[ flatIndex( { static_cast<int64_t>(indices)... } ) ];
        }

        void fill( host_value_t value ) {
            std::fill_n( buffer_.get(), size_, value );
        }

        // ====================================================================
        // Identity
        // ====================================================================

        std::string getUId() const override {
            return uid_;
        }

        std::string getName() const override {
            return name_;
        }

        void setName( const std::string& value ) {
            if (value.empty())
            {
                throw std::invalid_argument( "Tensor name cannot be empty." );
            }
            name_ = value;
        }

        std::string toString( bool showBuffer = false ) const {
            std::ostringstream oss;
            oss << "Tensor: " << uid_;
            if (!name_.empty()) oss << "::" << name_;
            oss << ", Shape: (";
            for (size_t i = 0; i < shape_.size(); ++i)
            {
                oss << shape_[ i ];
                if (i + 1 < shape_.size()) oss << ",";
            }
            oss << "), Size: " << size_ << ", Type: " << DataTypeTraits::type_name << std::endl;

            if (showBuffer)
            {
                for (size_t i = 0; i < size_; ++i)
                {
                    oss << buffer_.get()[ i ] << (i + 1 < size_ ? " " : "\n");
                }
            }
            return oss.str();
        }

        friend std::ostream& operator<<( std::ostream& os, const Tensor& tensor ) {
            os << tensor.toString();
            return os;
        }

    private:
        struct BufferDeleter
        {
            size_t bytes{ 0 };

            void operator()( host_value_t* ptr ) const {
                if (ptr)
                {
                    memoryResource().deallocate( ptr, bytes, DataTypeTraits::alignment );
                }
            }
        };

        std::shared_ptr<Compute::ComputeDevice> device_;
        std::string uid_;
        std::string name_;
        shape_t shape_;
        size_t size_{ 0 };
        std::unique_ptr<host_value_t[], BufferDeleter> buffer_{ nullptr, BufferDeleter{} };

        static TMemoryResource& memoryResource() {
            static TMemoryResource resource;
            return resource;
        }

        void allocateBuffer() {
            if (size_ == 0)
            {
                return;
            }

            size_t bytes = size_ * sizeof( host_value_t );
            void* raw = memoryResource().allocate( bytes, DataTypeTraits::alignment );
            buffer_ = std::unique_ptr<host_value_t[], BufferDeleter>(
                static_cast<host_value_t*>(raw), BufferDeleter{ bytes } );
            std::memset( raw, 0, bytes );
        }

        size_t flatIndex( std::initializer_list<int64_t> indices ) const {
            if (indices.size() != shape_.size())
            {
                throw std::out_of_range( fmt::format(
                    "Tensor index rank {} does not match tensor rank {}", indices.size(), shape_.size() ) );
            }

            size_t flat = 0;
            size_t d = 0;
            for (int64_t index : indices)
            {
                if (index < 0 || index >= shape_[ d ])
                {
                    throw std::out_of_range( fmt::format(
                        "Tensor index {} out of range for dimension {} with extent {}", index, d, shape_[ d ] ) );
                }
                flat = flat * static_cast<size_t>(shape_[ d ]) + static_cast<size_t>(index);
                ++d;
            }
            return flat;
        }

        static size_t computeSize( const shape_t& shape ) {
            size_t size = 1;
            for (int64_t extent : shape)
            {
                if (extent < 0)
                {
                    throw std::invalid_argument( "Tensor shape extents must be non-negative." );
                }
                size *= static_cast<size_t>(extent);
            }
            return size;
        }

        static std::shared_ptr<Compute::ComputeDevice> validateDevice( std::shared_ptr<Compute::ComputeDevice> device ) {
            if (!device)
            {
                throw std::invalid_argument( "Tensor requires a compute device." );
            }
            if (device->getDeviceType() != TMemoryResource::device_type)
            {
                throw std::invalid_argument( "Tensor device type does not match its memory resource." );
            }
            return device;
        }

        static std::string makeUId() {
            return "tensor_" + std::to_string( UniqueIdGenerator::getNextId() );
        }
    };

    template<TensorDataType TDataType>
    using CpuTensor = Tensor<TDataType, Compute::CpuMemoryResource>;
}

#endif
