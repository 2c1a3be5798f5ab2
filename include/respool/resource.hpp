#pragma once

#include <functional>
#include <memory>
#include <stdexcept>
#include <utility>

namespace respool {

    /**
     * @brief Interface every pooled resource type is managed through.
     *
     * The pool never constructs, cleans or checks resources itself; it asks
     * the factory. Methods may be called concurrently from several threads
     * and are never called while the pool's lock is held.
     */
    template <typename R>
    class ResourceFactory {
       public:
        virtual ~ResourceFactory() = default;

        /**
         * @brief Builds a new resource.
         * @note Exceptions (and null returns) reach the caller of acquire()
         * as Error::Code::CreationFailed. The pool never retries.
         */
        virtual std::unique_ptr<R> create() = 0;

        /**
         * @brief Clears all per-borrower state so the resource looks unused.
         * @note Must not throw for a structurally valid resource.
         */
        virtual void reset(R& resource) = 0;

        /// @brief Whether validate() performs a real health check
        virtual bool can_validate() const noexcept { return false; }

        /// @brief Reports whether a returned resource is still usable
        virtual bool validate([[maybe_unused]] R const& resource) {
            return true;
        }
    };

    /**
     * @brief ResourceFactory built from callables.
     *
     * Useful when the resource type has no natural home for pool hooks, e.g.
     * a third-party client object.
     */
    template <typename R>
    class FunctionResourceFactory final : public ResourceFactory<R> {
       public:
        using create_fn = std::function<std::unique_ptr<R>()>;
        using reset_fn = std::function<void(R&)>;
        using validate_fn = std::function<bool(R const&)>;

        /**
         * @brief Constructs a FunctionResourceFactory.
         * @param create Builds a resource. Required.
         * @param reset Cleans a returned resource. Required.
         * @param validate Health check. Empty means "no validation".
         */
        FunctionResourceFactory(create_fn create, reset_fn reset,
                                validate_fn validate = {})
            : create_(std::move(create)),
              reset_(std::move(reset)),
              validate_(std::move(validate)) {
            if (!create_ || !reset_) {
                throw std::invalid_argument(
                    "FunctionResourceFactory requires create and reset");
            }
        }

        std::unique_ptr<R> create() override { return create_(); }

        void reset(R& resource) override { reset_(resource); }

        bool can_validate() const noexcept override {
            return static_cast<bool>(validate_);
        }

        bool validate(R const& resource) override {
            return validate_ ? validate_(resource) : true;
        }

       private:
        create_fn create_;
        reset_fn reset_;
        validate_fn validate_;
    };

    /// @brief Convenience wrapper returning a shared FunctionResourceFactory
    template <typename R>
    std::shared_ptr<ResourceFactory<R>> make_factory(
        typename FunctionResourceFactory<R>::create_fn create,
        typename FunctionResourceFactory<R>::reset_fn reset,
        typename FunctionResourceFactory<R>::validate_fn validate = {}) {
        return std::make_shared<FunctionResourceFactory<R>>(
            std::move(create), std::move(reset), std::move(validate));
    }

}  // namespace respool
