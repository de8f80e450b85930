// surge

#include "surge/dataize.hh"

#include "surge/alloc.hh"
#include "surge/graph.hh"
#include "surge/log.hh"
#include "surge/native.hh"

#include "array.hh"
#include "graph_internal.hh"
#include "string.hh"
#include "utility.hh"

#include <algorithm>
#include <charconv>
#include <mutex>
#include <utility>

namespace surge {
    namespace {
        static constexpr char const logTag[] = "dataize";

        // never copied into a lookup's context
        bool isStructuralName(sgName name) noexcept
        {
            return sgNameEquals(name, sgAttr::rho) || sgNameEquals(name, sgAttr::pi) || sgNameEquals(name, sgAttr::lambda) ||
                sgNameEquals(name, sgAttr::delta) || sgNameEquals(name, sgAttr::beta) || sgNameEquals(name, sgAttr::xi);
        }

        // not an argument of an application
        bool isSystemName(sgName name) noexcept
        {
            return isStructuralName(name) || sgNameEquals(name, sgAttr::epsilon) || sgNameEquals(name, sgAttr::phi);
        }

        fmt::string_view view(sgName name) noexcept { return fmt::string_view(name.name, sgNameLen(name)); }

        class NativeContext final : public sgNativeContext
        {
        public:
            NativeContext(sgDataizeHost& host, sgBytes const* argv, uint32_t argc, sgArray<uint8_t>& result) noexcept
                : host_(host), argv_(argv), argc_(argc), result_(result)
            {
            }

            uint32_t getArgCount() const noexcept override { return argc_; }
            sgBytes getArgAt(uint32_t index) const noexcept override
            {
                SG_GUARD_OR(index < argc_, sgBytes{});
                return argv_[index];
            }

            void result(sgBytes value) override { result_.assign(value.data, value.size); }
            uint8_t* resultBuffer(uint32_t size) override
            {
                result_.clear();
                result_.resize(size);
                return result_.data();
            }

            void write(sgBytes bytes) override { host_.writeOutput(bytes); }

            void fail(sgErrorCode code) override { failure_ = code; }

            sgErrorCode failure() const noexcept { return failure_; }

        private:
            sgDataizeHost& host_;
            sgBytes const* argv_ = nullptr;
            uint32_t argc_ = 0;
            sgArray<uint8_t>& result_;
            sgErrorCode failure_ = sgErrorCode::None;
        };

        class Dataizer final : public sgDataizer
        {
        public:
            Dataizer(sgAllocator& alloc, sgDataizeHost& host, sgGraph& graph) noexcept
                : allocator_(alloc), host_(host), store_(sgStoreOf(graph)), logger_(store_.logger()), errors_(alloc), result_(alloc)
            {
            }

            void setConfig(sgDataizeConfig const& config) noexcept override { config_ = config; }
            void setLogger(sgLogger* logger) noexcept override { logger_ = logger; }

            bool dataize(sgVertexId vertex, sgBytes& out_bytes) override;
            bool dataizeLocator(char const* locator, char const* locatorEnd, sgBytes& out_bytes) override;
            bool locate(char const* locator, char const* locatorEnd, sgVertexId& out_vertex) override;

            uint32_t getErrorCount() const noexcept override { return errors_.size(); }
            sgError getError(uint32_t index) const noexcept override
            {
                SG_GUARD_OR(index < errors_.size(), sgError{});
                return errors_[index];
            }

            sgAllocator& allocator() noexcept { return allocator_; }

        private:
            enum class Form : uint8_t
            {
                Object,
                Dispatch,
                Application,
            };

            struct FormInfo
            {
                Form form = Form::Object;
                sgVertexId bearer = sgInvalidVertexId; // carries the form edge and the locator
                sgVertexId target = sgInvalidVertexId; // receiver (β/ξ) or callee (ε)
                bool dynamic = false;                  // ξ receiver
            };

            // where a name was first found on a π chain
            struct Hit
            {
                sgVertexId holder = sgInvalidVertexId;
                sgVertexId target = sgInvalidVertexId;
                bool found = false;
            };

            class DepthScope
            {
            public:
                explicit DepthScope(Dataizer& dataizer) noexcept : dataizer_(dataizer) { ++dataizer_.depth_; }
                ~DepthScope() { --dataizer_.depth_; }

                bool exceeded() const noexcept { return dataizer_.depth_ > dataizer_.config_.maxDepth; }

            private:
                Dataizer& dataizer_;
            };

            void begin() noexcept;
            bool finish(bool ok, sgVertexId vertex, sgBytes& out_bytes);
            bool fail(sgErrorCode code, sgVertexId vertex, sgName name = {}) noexcept;

            bool findOnChain(sgVertexId vertex, sgName name, Hit& out_hit);
            bool formOf(sgVertexId vertex, FormInfo& out_form);

            bool lookup(sgVertexId vertex, sgName name, sgVertexId& out_target);
            bool materialize(sgVertexId context, sgName name, sgVertexId prototype, sgVertexId& out_copy);

            bool resolve(sgVertexId vertex, sgVertexId& out_object);
            bool resolveForm(sgVertexId vertex, sgVertexId& out_object);
            bool resolveHome(sgVertexId vertex, sgVertexId xiTarget, sgVertexId& out_home);
            bool apply(sgVertexId vertex, FormInfo const& form, sgVertexId& out_object);
            bool hasOwnBindings(sgVertexId vertex) const noexcept;
            bool instantiate(sgVertexId vertex, sgVertexId& out_object);
            bool carryPayload(sgVertexId from, sgVertexId to);
            bool walkLocator(sgVertexId start, sgName locator, sgVertexId& out_object);
            bool step(sgVertexId current, sgName token, sgVertexId& out_next, bool& out_stop);

            bool dataizeVertex(sgVertexId vertex);
            bool evaluate(sgVertexId vertex);
            bool evaluateObject(sgVertexId vertex);
            bool findLiteral(sgVertexId vertex, sgBytes& out_bytes, bool& out_found);
            bool callNative(sgVertexId vertex, sgVertexId lambda);
            void copyCache(sgVertexId from, sgVertexId to);

            sgAllocator& allocator_;
            sgDataizeHost& host_;
            sgGraphStore& store_;
            sgDataizeConfig config_;
            sgLogger* logger_ = nullptr;
            sgArray<sgError> errors_;
            sgArray<uint8_t> result_;
            sgError error_;
            uint32_t depth_ = 0;
        };
    } // namespace

    sgDataizer* sgCreateDataizer(sgAllocator& alloc, sgDataizeHost& host, sgGraph& graph)
    {
        return sgNew<Dataizer>(alloc, alloc, host, graph);
    }

    void sgDestroyDataizer(sgDataizer* dataizer)
    {
        if (dataizer == nullptr)
            return;

        Dataizer* const impl = static_cast<Dataizer*>(dataizer);
        sgDelete(impl->allocator(), impl);
    }

    bool Dataizer::dataize(sgVertexId vertex, sgBytes& out_bytes)
    {
        std::lock_guard<std::mutex> lock(store_.writeLock());

        begin();
        return finish(dataizeVertex(vertex), vertex, out_bytes);
    }

    bool Dataizer::dataizeLocator(char const* locator, char const* locatorEnd, sgBytes& out_bytes)
    {
        SG_GUARD_OR(locator != nullptr, false);

        std::lock_guard<std::mutex> lock(store_.writeLock());

        begin();

        sgVertexId target = sgInvalidVertexId;
        if (!walkLocator(sgRootVertexId, sgName{locator, locatorEnd}, target))
            return finish(false, sgRootVertexId, out_bytes);

        return finish(dataizeVertex(target), target, out_bytes);
    }

    bool Dataizer::locate(char const* locator, char const* locatorEnd, sgVertexId& out_vertex)
    {
        SG_GUARD_OR(locator != nullptr, false);

        std::lock_guard<std::mutex> lock(store_.writeLock());

        begin();

        if (!walkLocator(sgRootVertexId, sgName{locator, locatorEnd}, out_vertex))
        {
            errors_.pushBack(error_);
            return false;
        }
        return true;
    }

    void Dataizer::begin() noexcept
    {
        errors_.clear();
        error_ = sgError{};
        depth_ = 0;
    }

    bool Dataizer::finish(bool ok, sgVertexId vertex, sgBytes& out_bytes)
    {
        out_bytes = sgBytes{};

        if (!ok)
        {
            errors_.pushBack(error_);
            SG_LOG_DEBUG(logger_, logTag, "ν{} failed: {} at ν{} '{}'", vertex.value(), sgErrorCodeName(error_.code),
                error_.vertex.value(), error_.name);
            return false;
        }

        sgVertexRecord const* const record = store_.find(vertex);
        result_.assign(record->cache.data(), record->cache.size());
        out_bytes = sgBytes{.data = result_.data(), .size = result_.size()};

        SG_LOG_DEBUG(logger_, logTag, "ν{} is {} byte(s)", vertex.value(), out_bytes.size);
        return true;
    }

    bool Dataizer::fail(sgErrorCode code, sgVertexId vertex, sgName name) noexcept
    {
        error_ = sgMakeError(code, vertex, name);
        return false;
    }

    bool Dataizer::findOnChain(sgVertexId vertex, sgName name, Hit& out_hit)
    {
        out_hit = Hit{};

        sgVertexId current = vertex;
        for (uint32_t hop = 0; hop != config_.maxChain; ++hop)
        {
            sgVertexId target = sgInvalidVertexId;
            if (store_.attr(current, name, target))
            {
                out_hit = Hit{.holder = current, .target = target, .found = true};
                return true;
            }

            if (!store_.attr(current, sgName{sgAttr::pi}, current))
                return true;
        }

        return fail(sgErrorCode::CyclicDataization, vertex, sgName{sgAttr::pi});
    }

    bool Dataizer::formOf(sgVertexId vertex, FormInfo& out_form)
    {
        out_form = FormInfo{};

        sgVertexId current = vertex;
        for (uint32_t hop = 0; hop != config_.maxChain; ++hop)
        {
            sgVertexId target = sgInvalidVertexId;
            if (store_.attr(current, sgName{sgAttr::beta}, target))
            {
                out_form = FormInfo{.form = Form::Dispatch, .bearer = current, .target = target, .dynamic = false};
                return true;
            }
            if (store_.attr(current, sgName{sgAttr::xi}, target))
            {
                out_form = FormInfo{.form = Form::Dispatch, .bearer = current, .target = target, .dynamic = true};
                return true;
            }
            if (store_.attr(current, sgName{sgAttr::epsilon}, target))
            {
                out_form = FormInfo{.form = Form::Application, .bearer = current, .target = target};
                return true;
            }

            if (!store_.attr(current, sgName{sgAttr::pi}, current))
                return true;
        }

        return fail(sgErrorCode::CyclicDataization, vertex, sgName{sgAttr::pi});
    }

    bool Dataizer::lookup(sgVertexId vertex, sgName name, sgVertexId& out_target)
    {
        sgVertexId current = vertex;
        for (uint32_t hop = 0; hop != config_.maxChain; ++hop)
        {
            Hit hit;
            if (!findOnChain(current, name, hit))
                return false;

            if (hit.found)
            {
                if (hit.holder == current || isStructuralName(name))
                {
                    out_target = hit.target;
                    return true;
                }
                return materialize(current, name, hit.target, out_target);
            }

            Hit parent;
            if (!findOnChain(current, sgName{sgAttr::rho}, parent))
                return false;
            if (!parent.found)
                break;
            current = parent.target;
        }

        return fail(sgErrorCode::AttributeNotFound, vertex, name);
    }

    bool Dataizer::materialize(sgVertexId context, sgName name, sgVertexId prototype, sgVertexId& out_copy)
    {
        sgVertexId copy = sgInvalidVertexId;
        if (!store_.addFresh(copy, error_) || !store_.bind(copy, prototype, sgName{sgAttr::pi}, error_) ||
            !store_.bind(copy, context, sgName{sgAttr::rho}, error_) ||
            !store_.bind(context, copy, name, error_))
            return false;

        SG_LOG_TRACE(logger_, logTag, "ν{}.{} copies ν{} as ν{}", context.value(), view(name), prototype.value(), copy.value());
        out_copy = copy;
        return true;
    }

    bool Dataizer::resolve(sgVertexId vertex, sgVertexId& out_object)
    {
        DepthScope const scope(*this);
        if (scope.exceeded())
            return fail(sgErrorCode::DepthExceeded, vertex);

        sgVertexRecord* record = store_.find(vertex);
        if (record == nullptr)
            return fail(sgErrorCode::UnknownVertex, vertex);

        if (record->resolved.valid())
        {
            out_object = record->resolved;
            return true;
        }
        if (record->resolving)
            return fail(sgErrorCode::CyclicDataization, vertex);

        record->resolving = true;
        bool const ok = resolveForm(vertex, out_object);

        // resolution may have added vertices
        record = store_.find(vertex);
        record->resolving = false;
        if (ok)
            record->resolved = out_object;
        return ok;
    }

    bool Dataizer::resolveForm(sgVertexId vertex, sgVertexId& out_object)
    {
        FormInfo form;
        if (!formOf(vertex, form))
            return false;

        switch (form.form)
        {
        case Form::Object:
            out_object = vertex;
            return true;
        case Form::Application:
            return apply(vertex, form, out_object);
        case Form::Dispatch:
            // a copy of an expression overrides the object it evaluates to
            if (form.bearer != vertex && hasOwnBindings(vertex))
                return instantiate(vertex, out_object);
            break;
        }

        sgVertexId receiver = sgInvalidVertexId;
        if (form.dynamic ? !resolveHome(vertex, form.target, receiver) : !resolve(form.target, receiver))
            return false;

        sgBytes text;
        if (!store_.data(form.bearer, text))
            text = sgBytes{};

        // the payload buffer belongs to the store; keep our own copy while walking
        char const* const first = reinterpret_cast<char const*>(text.data);
        sgString const locator(allocator_, first, first + text.size);

        SG_LOG_TRACE(logger_, logTag, "ν{} dispatches '{}' on ν{}", vertex.value(), view(locator.name()), receiver.value());
        return walkLocator(receiver, locator.name(), out_object);
    }

    bool Dataizer::resolveHome(sgVertexId vertex, sgVertexId xiTarget, sgVertexId& out_home)
    {
        Hit parent;
        if (!findOnChain(vertex, sgName{sgAttr::rho}, parent))
            return false;

        sgVertexId current = parent.found ? parent.target : xiTarget;
        for (uint32_t hop = 0; hop != config_.maxChain; ++hop)
        {
            FormInfo form;
            if (!formOf(current, form))
                return false;

            if (form.form == Form::Object)
            {
                out_home = current;
                return true;
            }

            // expressions are not homes; their context is
            if (!findOnChain(current, sgName{sgAttr::rho}, parent))
                return false;
            if (!parent.found)
                return resolve(current, out_home);
            current = parent.target;
        }

        return fail(sgErrorCode::DepthExceeded, vertex, sgName{sgAttr::xi});
    }

    bool Dataizer::apply(sgVertexId vertex, FormInfo const& form, sgVertexId& out_object)
    {
        sgVertexId callee = sgInvalidVertexId;
        if (!lookup(vertex, sgName{sgAttr::epsilon}, callee) || !resolve(callee, callee))
            return false;

        // argument names in chain order; the nearest binding of a name wins
        sgArray<sgString> names(allocator_);
        sgVertexId literal = sgInvalidVertexId;
        sgVertexId payloadHolder = sgInvalidVertexId;
        sgVertexId current = vertex;
        for (uint32_t hop = 0;; ++hop)
        {
            if (hop == config_.maxChain)
                return fail(sgErrorCode::CyclicDataization, vertex, sgName{sgAttr::pi});

            sgBytes payload;
            if (!payloadHolder.valid() && store_.data(current, payload))
                payloadHolder = current;
            if (!literal.valid() && !store_.attr(current, sgName{sgAttr::delta}, literal))
                literal = sgInvalidVertexId;

            for (sgEdgeId edge = store_.firstEdge(current); edge.valid(); edge = store_.nextEdge(edge))
            {
                sgName const name = store_.edge(edge).name;
                if (isSystemName(name))
                    continue;

                uint32_t const length = sgNameLen(name);
                bool const seen =
                    std::any_of(names.begin(), names.end(), [&](sgString const& known) { return known.equals(name.name, length); });
                if (!seen)
                    names.emplaceBack(allocator_, name);
            }

            if (current == form.bearer || !store_.attr(current, sgName{sgAttr::pi}, current))
                break;
        }

        sgVertexId instance = sgInvalidVertexId;
        if (!store_.addFresh(instance, error_) || !store_.bind(instance, callee, sgName{sgAttr::pi}, error_))
            return false;

        // the application's own literal travels with the instance
        if (payloadHolder.valid() && !carryPayload(payloadHolder, instance))
            return false;
        if (literal.valid() && !store_.bind(instance, literal, sgName{sgAttr::delta}, error_))
            return false;

        for (sgString const& name : names)
        {
            sgVertexId argument = sgInvalidVertexId;
            if (!lookup(vertex, name.name(), argument) || !store_.bind(instance, argument, name.name(), error_))
                return false;
        }

        SG_LOG_TRACE(logger_, logTag, "ν{} applies ν{} with {} binding(s) as ν{}", vertex.value(), callee.value(), names.size(),
            instance.value());
        out_object = instance;
        return true;
    }

    bool Dataizer::hasOwnBindings(sgVertexId vertex) const noexcept
    {
        sgBytes payload;
        if (store_.data(vertex, payload))
            return true;

        for (sgEdgeId edge = store_.firstEdge(vertex); edge.valid(); edge = store_.nextEdge(edge))
        {
            sgName const name = store_.edge(edge).name;
            if (!sgNameEquals(name, sgAttr::pi) && !sgNameEquals(name, sgAttr::rho))
                return true;
        }
        return false;
    }

    bool Dataizer::instantiate(sgVertexId vertex, sgVertexId& out_object)
    {
        sgVertexId prototype = sgInvalidVertexId;
        if (!store_.attr(vertex, sgName{sgAttr::pi}, prototype) || !resolve(prototype, prototype))
            return false;

        sgVertexId instance = sgInvalidVertexId;
        if (!store_.addFresh(instance, error_) || !store_.bind(instance, prototype, sgName{sgAttr::pi}, error_))
            return false;

        for (sgEdgeId edge = store_.firstEdge(vertex); edge.valid(); edge = store_.nextEdge(edge))
        {
            sgEdge const binding = store_.edge(edge);
            if (sgNameEquals(binding.name, sgAttr::pi))
                continue;
            if (!store_.bind(instance, binding.to, binding.name, error_))
                return false;
        }

        if (!carryPayload(vertex, instance))
            return false;

        SG_LOG_TRACE(logger_, logTag, "ν{} copies ν{} with its own bindings as ν{}", vertex.value(), prototype.value(),
            instance.value());
        out_object = instance;
        return true;
    }

    bool Dataizer::carryPayload(sgVertexId from, sgVertexId to)
    {
        sgBytes payload;
        if (!store_.data(from, payload))
            return true;

        // put may move payload storage around; work from a private copy
        sgArray<uint8_t> bytes(allocator_);
        bytes.assign(payload.data, payload.size);
        return store_.put(to, sgBytes{.data = bytes.data(), .size = bytes.size()}, error_);
    }

    bool Dataizer::walkLocator(sgVertexId start, sgName locator, sgVertexId& out_object)
    {
        out_object = start;

        uint32_t const length = sgNameLen(locator);
        if (length == 0)
            return true;

        char const* const last = locator.name + length;
        for (char const* cursor = locator.name;;)
        {
            char const* const dot = std::find(cursor, last, '.');

            bool stop = false;
            if (!step(out_object, sgName{cursor, dot}, out_object, stop))
                return false;
            if (stop || dot == last)
                return true;

            cursor = dot + 1;
        }
    }

    bool Dataizer::step(sgVertexId current, sgName token, sgVertexId& out_next, bool& out_stop)
    {
        out_stop = false;

        if (sgIsNameEmpty(token))
            return fail(sgErrorCode::AttributeNotFound, current, token);

        if (sgNameEquals(token, "Φ") || sgNameEquals(token, "Q"))
        {
            out_next = sgRootVertexId;
            return true;
        }

        if (sgNameEquals(token, sgAttr::xi))
        {
            out_next = current;
            return true;
        }

        if (sgNameEquals(token, sgAttr::delta))
        {
            out_next = current;
            out_stop = true;
            return true;
        }

        if (sgNameEquals(token, sgAttr::rho))
        {
            Hit parent;
            if (!findOnChain(current, token, parent))
                return false;
            if (!parent.found)
                return fail(sgErrorCode::AttributeNotFound, current, token);
            return resolve(parent.target, out_next);
        }

        // absolute vertex reference
        static constexpr char const nu[] = "ν";
        if (sgNameStartsWith(token, nu))
        {
            char const* const digits = token.name + sizeof(nu) - 1;
            char const* const end = token.name + sgNameLen(token);

            uint32_t id = 0;
            auto const [ptr, ec] = std::from_chars(digits, end, id);
            if (ec == std::errc{} && ptr == end && digits != end)
            {
                if (!store_.contains(sgVertexId{id}))
                    return fail(sgErrorCode::AttributeNotFound, current, token);
                return resolve(sgVertexId{id}, out_next);
            }
        }

        sgVertexId target = sgInvalidVertexId;
        return lookup(current, token, target) && resolve(target, out_next);
    }

    bool Dataizer::dataizeVertex(sgVertexId vertex)
    {
        DepthScope const scope(*this);
        if (scope.exceeded())
            return fail(sgErrorCode::DepthExceeded, vertex);

        sgVertexRecord* record = store_.find(vertex);
        if (record == nullptr)
            return fail(sgErrorCode::UnknownVertex, vertex);

        switch (record->status)
        {
        case sgEvalStatus::Cached:
            return true;
        case sgEvalStatus::Failed:
            error_ = record->failure;
            return false;
        case sgEvalStatus::InProgress:
            return fail(sgErrorCode::CyclicDataization, vertex);
        case sgEvalStatus::Unvisited:
            break;
        }

        record->status = sgEvalStatus::InProgress;
        bool const ok = evaluate(vertex);

        record = store_.find(vertex);
        if (ok)
        {
            record->status = sgEvalStatus::Cached;
        }
        else
        {
            record->status = sgEvalStatus::Failed;
            record->failure = error_;
        }
        return ok;
    }

    bool Dataizer::evaluate(sgVertexId vertex)
    {
        sgVertexId object = sgInvalidVertexId;
        if (!resolve(vertex, object))
            return false;

        if (object == vertex)
            return evaluateObject(vertex);

        if (!dataizeVertex(object))
            return false;

        copyCache(object, vertex);
        return true;
    }

    bool Dataizer::evaluateObject(sgVertexId vertex)
    {
        sgBytes literal;
        bool found = false;
        if (!findLiteral(vertex, literal, found))
            return false;
        if (found)
        {
            store_.find(vertex)->cache.assign(literal.data, literal.size);
            return true;
        }

        Hit lambda;
        if (!findOnChain(vertex, sgName{sgAttr::lambda}, lambda))
            return false;
        if (lambda.found)
            return callNative(vertex, lambda.target);

        Hit decoratee;
        if (!findOnChain(vertex, sgName{sgAttr::phi}, decoratee))
            return false;
        if (decoratee.found)
        {
            sgVertexId target = sgInvalidVertexId;
            if (!lookup(vertex, sgName{sgAttr::phi}, target) || !dataizeVertex(target))
                return false;

            copyCache(target, vertex);
            return true;
        }

        return fail(sgErrorCode::AttributeNotFound, vertex, sgName{sgAttr::delta});
    }

    bool Dataizer::findLiteral(sgVertexId vertex, sgBytes& out_bytes, bool& out_found)
    {
        out_found = false;

        sgVertexId current = vertex;
        for (uint32_t hop = 0; hop != config_.maxChain; ++hop)
        {
            sgVertexId literal = sgInvalidVertexId;
            if (store_.data(current, out_bytes) ||
                (store_.attr(current, sgName{sgAttr::delta}, literal) && store_.data(literal, out_bytes)))
            {
                out_found = true;
                return true;
            }

            if (!store_.attr(current, sgName{sgAttr::pi}, current))
                return true;
        }

        return fail(sgErrorCode::CyclicDataization, vertex, sgName{sgAttr::pi});
    }

    bool Dataizer::callNative(sgVertexId vertex, sgVertexId lambda)
    {
        sgBytes text;
        if (!store_.data(lambda, text))
            return fail(sgErrorCode::UnknownNative, vertex, sgName{sgAttr::lambda});

        char const* const first = reinterpret_cast<char const*>(text.data);
        sgString const name(allocator_, first, first + text.size);

        sgNativeMeta meta;
        if (!host_.lookupNative(name.name(), meta))
            return fail(sgErrorCode::UnknownNative, vertex, name.name());

        sgArray<sgVertexId> arguments(allocator_);
        if (meta.kind == sgNativeKind::Method)
        {
            Hit receiver;
            if (!findOnChain(vertex, sgName{sgAttr::rho}, receiver))
                return false;
            if (!receiver.found)
                return fail(sgErrorCode::AttributeNotFound, vertex, sgName{sgAttr::rho});
            arguments.pushBack(receiver.target);
        }

        // α0, α1, ... until the first gap
        char positional[16];
        for (uint32_t index = 0;; ++index)
        {
            auto const written = fmt::format_to_n(positional, sizeof(positional), "{}{}", sgAttr::alpha, index);
            sgName const argName{positional, written.out};

            Hit hit;
            if (!findOnChain(vertex, argName, hit))
                return false;
            if (!hit.found)
                break;

            sgVertexId argument = sgInvalidVertexId;
            if (!lookup(vertex, argName, argument))
                return false;
            arguments.pushBack(argument);
        }

        for (sgVertexId const argument : arguments)
        {
            if (!dataizeVertex(argument))
                return false;
        }

        // caches of finished vertices are never reassigned, so these stay valid
        sgArray<sgBytes> values(allocator_);
        values.reserve(arguments.size());
        for (sgVertexId const argument : arguments)
        {
            sgVertexRecord const* const record = store_.find(argument);
            values.pushBack(sgBytes{.data = record->cache.data(), .size = record->cache.size()});
        }

        SG_LOG_TRACE(logger_, logTag, "ν{} calls {} with {} argument(s)", vertex.value(), view(name.name()), values.size());

        sgArray<uint8_t> result(allocator_);
        NativeContext context(host_, values.data(), values.size(), result);
        if (!meta.function(context, meta.userData))
        {
            sgErrorCode const code = context.failure() != sgErrorCode::None ? context.failure() : sgErrorCode::NativeFailure;
            return fail(code, vertex, name.name());
        }

        store_.find(vertex)->cache = std::move(result);
        return true;
    }

    void Dataizer::copyCache(sgVertexId from, sgVertexId to)
    {
        sgVertexRecord const* const source = store_.find(from);
        sgVertexRecord* const target = store_.find(to);
        target->cache.assign(source->cache.data(), source->cache.size());
    }
} // namespace surge
