// surge

#include "surge/assembler.hh"

#include "surge/alloc.hh"
#include "surge/graph.hh"
#include "surge/log.hh"

#include "array.hh"
#include "fnv.hh"
#include "index.hh"
#include "string.hh"
#include "utility.hh"

#include <charconv>
#include <cstdlib>
#include <cstring>

namespace {
    constexpr bool isAsciiDigit(char c) noexcept { return c >= '0' && c <= '9'; }
    constexpr bool isAsciiSpace(char c) noexcept { return c == ' ' || c == '\t' || c == '\r'; }
    constexpr bool isHexDigit(char c) noexcept { return isAsciiDigit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F'); }
    constexpr bool isHexSeparator(char c) noexcept { return c == '-' || c == '\n' || isAsciiSpace(c); }

    // words run until punctuation, a comment or the end of the line
    constexpr bool isWordChar(char c) noexcept
    {
        return c != '(' && c != ')' && c != ',' && c != ';' && c != '#' && c != '\n';
    }

    constexpr uint8_t hexValue(char c) noexcept
    {
        if (c >= '0' && c <= '9')
            return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f')
            return static_cast<uint8_t>(c - 'a' + 10);
        return static_cast<uint8_t>(c - 'A' + 10);
    }

    constexpr char toAsciiLower(char c) noexcept { return c >= 'A' && c <= 'Z' ? c - 'A' + 'a' : c; }

    bool keywordEqual(surge::sgName text, char const* keyword) noexcept
    {
        uint32_t const length = surge::sgNameLen(text);
        if (length != std::strlen(keyword))
            return false;

        for (uint32_t index = 0; index != length; ++index)
        {
            if (toAsciiLower(text.name[index]) != toAsciiLower(keyword[index]))
                return false;
        }
        return true;
    }
} // namespace

namespace surge {
    namespace {
        static constexpr char const logTag[] = "assembler";

        class Assembler final : public sgAssembler
        {
        public:
            explicit Assembler(sgAllocator& alloc) noexcept
                : allocator_(alloc), tokens_(alloc), aliases_(alloc), errors_(alloc), scratch_(alloc)
            {
            }

            void reset() override;
            void setRoot(sgVertexId root) noexcept override { root_ = root; }
            void setLogger(sgLogger* logger) noexcept override { logger_ = logger; }

            bool assemble(sgGraph& graph, char const* source, char const* sourceEnd = nullptr) override;

            uint32_t instructionCount() const noexcept override { return instructionCount_; }
            bool lookupAlias(char const* alias, sgVertexId& out_vertex) const noexcept override;

            uint32_t getErrorCount() const noexcept override { return errors_.size(); }
            sgError getError(uint32_t index) const noexcept override;

            sgAllocator& allocator() noexcept { return allocator_; }

        private:
            SG_DEFINE_INDEX(TokenIndex);
            SG_DEFINE_INDEX(AliasIndex);

            enum class TokenType : uint8_t
            {
                Invalid,

                Word,
                Quoted,
                LParen,
                RParen,
                Comma,
                Semicolon,
                End,
            };

            enum class Opcode : uint8_t
            {
                Add,
                Bind,
                Put,
            };

            struct Token
            {
                uint32_t offset = 0;
                uint32_t length = 0;
                uint32_t line = 0;
                TokenType type = TokenType::Invalid;
            };

            struct Alias
            {
                Alias(sgString&& aliasName, uint64_t hash, sgVertexId vertexId) noexcept
                    : name(static_cast<sgString&&>(aliasName)), nameHash(hash), vertex(vertexId)
                {
                }

                sgString name;
                uint64_t nameHash = 0;
                sgVertexId vertex;
            };

            // BIND accepts a leading, ignored edge label in its older four-argument form
            static constexpr uint32_t maxArgs = 4;

            struct Instruction
            {
                Opcode opcode = Opcode::Add;
                uint32_t line = 0;
                uint32_t argCount = 0;
                sgName args[maxArgs];
            };

            bool tokenize();
            bool parseInstruction(Instruction& out_instruction);
            bool apply(sgGraph& graph, Instruction const& instruction);

            bool resolveVertex(sgGraph& graph, sgName text, uint32_t line, bool introduce, sgVertexId& out_vertex);
            AliasIndex findAlias(sgName alias) const noexcept;

            bool parseData(sgName text);
            bool parseHex(char const* first, char const* last);
            bool parseString(char const* first, char const* last);
            bool parseInt(char const* first, char const* last);
            bool parseFloat(char const* first, char const* last);

            sgName tokenText(Token const& token) const noexcept;
            Token const& peek() const noexcept { return tokens_[nextToken_]; }
            Token const& advance() noexcept;

            bool fail(sgErrorCode code, sgVertexId vertex, sgName name, uint32_t line);
            bool fail(sgError error, uint32_t line);

            sgAllocator& allocator_;
            sgLogger* logger_ = nullptr;
            sgArray<Token, TokenIndex> tokens_;
            sgArray<Alias, AliasIndex> aliases_;
            sgArray<sgError> errors_;
            sgArray<uint8_t> scratch_;
            char const* source_ = nullptr;
            char const* sourceEnd_ = nullptr;
            TokenIndex nextToken_ = sgInvalidIndex;
            sgVertexId root_ = sgRootVertexId;
            uint32_t nextFresh_ = 0;
            uint32_t instructionCount_ = 0;
        };
    } // namespace

    sgAssembler* sgCreateAssembler(sgAllocator& alloc)
    {
        return sgNew<Assembler>(alloc, alloc);
    }

    void sgDestroyAssembler(sgAssembler* assembler)
    {
        if (assembler == nullptr)
            return;

        Assembler* const impl = static_cast<Assembler*>(assembler);
        sgDelete(impl->allocator(), impl);
    }

    void Assembler::reset()
    {
        tokens_.clear();
        aliases_.clear();
        errors_.clear();
        scratch_.clear();
        source_ = sourceEnd_ = nullptr;
        nextToken_ = sgInvalidIndex;
        nextFresh_ = 0;
        instructionCount_ = 0;
    }

    bool Assembler::assemble(sgGraph& graph, char const* source, char const* sourceEnd)
    {
        SG_GUARD_OR(source != nullptr, false);

        reset();

        source_ = source;
        sourceEnd_ = sourceEnd != nullptr ? sourceEnd : source + std::strlen(source);

        if (!tokenize())
            return false;

        nextToken_ = TokenIndex{0};
        while (peek().type != TokenType::End)
        {
            Instruction instruction;
            if (!parseInstruction(instruction))
                return false;
            if (!apply(graph, instruction))
                return false;
            ++instructionCount_;
        }

        SG_LOG_DEBUG(logger_, logTag, "assembled {} instructions, {} aliases", instructionCount_, aliases_.size());
        return true;
    }

    bool Assembler::lookupAlias(char const* alias, sgVertexId& out_vertex) const noexcept
    {
        SG_GUARD_OR(alias != nullptr, false);

        if (*alias == '$')
            ++alias;

        AliasIndex const index = findAlias(sgName{alias});
        if (!index.valid())
            return false;

        out_vertex = aliases_[index].vertex;
        return true;
    }

    sgError Assembler::getError(uint32_t index) const noexcept
    {
        SG_GUARD_OR(index < errors_.size(), sgError{});
        return errors_[index];
    }

    bool Assembler::tokenize()
    {
        uint32_t line = 1;
        char const* p = source_;

        while (p != sourceEnd_)
        {
            char const c = *p;
            uint32_t const offset = static_cast<uint32_t>(p - source_);

            if (c == '\n')
            {
                ++line;
                ++p;
                continue;
            }

            if (isAsciiSpace(c))
            {
                ++p;
                continue;
            }

            if (c == '#')
            {
                while (p != sourceEnd_ && *p != '\n')
                    ++p;
                continue;
            }

            TokenType punctuation = TokenType::Invalid;
            switch (c)
            {
            case '(': punctuation = TokenType::LParen; break;
            case ')': punctuation = TokenType::RParen; break;
            case ',': punctuation = TokenType::Comma; break;
            case ';': punctuation = TokenType::Semicolon; break;
            default: break;
            }

            if (punctuation != TokenType::Invalid)
            {
                tokens_.pushBack(Token{.offset = offset, .length = 1, .line = line, .type = punctuation});
                ++p;
                continue;
            }

            if (c == '\'' || c == '"')
            {
                uint32_t const startLine = line;
                char const* const start = ++p;
                while (p != sourceEnd_ && *p != c)
                {
                    if (*p == '\n')
                        ++line;
                    ++p;
                }

                if (p == sourceEnd_)
                    return fail(sgErrorCode::Malformed, sgInvalidVertexId, sgName{start - 1, sourceEnd_}, startLine);

                tokens_.pushBack(Token{.offset = static_cast<uint32_t>(start - source_),
                    .length = static_cast<uint32_t>(p - start),
                    .line = startLine,
                    .type = TokenType::Quoted});
                ++p;
                continue;
            }

            char const* const start = p;
            while (p != sourceEnd_ && isWordChar(*p))
                ++p;

            char const* end = p;
            while (end != start && isAsciiSpace(end[-1]))
                --end;

            tokens_.pushBack(
                Token{.offset = offset, .length = static_cast<uint32_t>(end - start), .line = line, .type = TokenType::Word});
        }

        tokens_.pushBack(Token{.offset = static_cast<uint32_t>(sourceEnd_ - source_), .line = line, .type = TokenType::End});
        return true;
    }

    bool Assembler::parseInstruction(Instruction& out_instruction)
    {
        Token const& head = advance();
        out_instruction.line = head.line;

        if (head.type != TokenType::Word)
            return fail(sgErrorCode::Malformed, sgInvalidVertexId, tokenText(head), head.line);

        sgName const opcode = tokenText(head);
        if (keywordEqual(opcode, "ADD"))
            out_instruction.opcode = Opcode::Add;
        else if (keywordEqual(opcode, "BIND"))
            out_instruction.opcode = Opcode::Bind;
        else if (keywordEqual(opcode, "PUT") || keywordEqual(opcode, "DATA"))
            out_instruction.opcode = Opcode::Put;
        else
            return fail(sgErrorCode::Malformed, sgInvalidVertexId, opcode, head.line);

        Token const& open = advance();
        if (open.type != TokenType::LParen)
            return fail(sgErrorCode::Malformed, sgInvalidVertexId, opcode, open.line);

        for (;;)
        {
            Token const& arg = advance();
            if (arg.type != TokenType::Word && arg.type != TokenType::Quoted)
                return fail(sgErrorCode::Malformed, sgInvalidVertexId, opcode, arg.line);
            if (out_instruction.argCount == maxArgs)
                return fail(sgErrorCode::Malformed, sgInvalidVertexId, opcode, arg.line);

            out_instruction.args[out_instruction.argCount++] = tokenText(arg);

            Token const& separator = advance();
            if (separator.type == TokenType::RParen)
                break;
            if (separator.type != TokenType::Comma)
                return fail(sgErrorCode::Malformed, sgInvalidVertexId, opcode, separator.line);
        }

        Token const& terminator = advance();
        if (terminator.type != TokenType::Semicolon)
            return fail(sgErrorCode::Malformed, sgInvalidVertexId, opcode, terminator.line);

        return true;
    }

    bool Assembler::apply(sgGraph& graph, Instruction const& instruction)
    {
        uint32_t const line = instruction.line;
        sgError error;

        switch (instruction.opcode)
        {
        case Opcode::Add: {
            if (instruction.argCount != 1)
                return fail(sgErrorCode::Malformed, sgInvalidVertexId, sgName{"ADD"}, line);

            sgVertexId vertex = sgInvalidVertexId;
            if (!resolveVertex(graph, instruction.args[0], line, true, vertex))
                return false;

            // sources conventionally open with ADD(ν0) although the root always exists
            if (vertex == root_ && graph.contains(vertex))
                return true;

            if (!graph.add(vertex, error))
                return fail(error, line);

            SG_LOG_TRACE(logger_, logTag, "{}: ADD ν{}", line, vertex.value());
            return true;
        }
        case Opcode::Bind: {
            if (instruction.argCount != 3 && instruction.argCount != 4)
                return fail(sgErrorCode::Malformed, sgInvalidVertexId, sgName{"BIND"}, line);

            uint32_t const first = instruction.argCount - 3;

            sgVertexId from = sgInvalidVertexId;
            sgVertexId to = sgInvalidVertexId;
            if (!resolveVertex(graph, instruction.args[first], line, false, from))
                return false;
            if (!resolveVertex(graph, instruction.args[first + 1], line, false, to))
                return false;

            sgName const name = instruction.args[first + 2];
            if (!graph.bind(from, to, name, error))
                return fail(error, line);

            SG_LOG_TRACE(logger_, logTag, "{}: BIND ν{} -{}-> ν{}", line, from.value(), fmt::string_view(name.name, sgNameLen(name)),
                to.value());
            return true;
        }
        case Opcode::Put: {
            if (instruction.argCount != 2)
                return fail(sgErrorCode::Malformed, sgInvalidVertexId, sgName{"PUT"}, line);

            sgVertexId vertex = sgInvalidVertexId;
            if (!resolveVertex(graph, instruction.args[0], line, false, vertex))
                return false;

            if (!parseData(instruction.args[1]))
                return fail(sgErrorCode::Malformed, vertex, instruction.args[1], line);

            if (!graph.put(vertex, sgBytes{.data = scratch_.data(), .size = scratch_.size()}, error))
                return fail(error, line);

            SG_LOG_TRACE(logger_, logTag, "{}: PUT ν{} ({} bytes)", line, vertex.value(), scratch_.size());
            return true;
        }
        }

        return fail(sgErrorCode::Malformed, sgInvalidVertexId, sgName{}, line);
    }

    bool Assembler::resolveVertex(sgGraph& graph, sgName text, uint32_t line, bool introduce, sgVertexId& out_vertex)
    {
        uint32_t const length = sgNameLen(text);
        if (length == 0)
            return fail(sgErrorCode::Malformed, sgInvalidVertexId, text, line);

        if (text.name[0] == '$')
        {
            sgName const alias{text.name + 1, text.name + length};
            if (sgIsNameEmpty(alias) || sgNameEquals(alias, "ν0") || sgNameEquals(alias, "v0"))
                return fail(sgErrorCode::Malformed, sgInvalidVertexId, text, line);

            AliasIndex const index = findAlias(alias);
            if (index.valid())
            {
                out_vertex = aliases_[index].vertex;
                return true;
            }

            // only ADD may introduce an alias; anything else is a forward reference
            if (!introduce)
                return fail(sgErrorCode::UnknownVertex, sgInvalidVertexId, text, line);

            uint32_t const fresh = nextFresh_ > graph.nextVertexId().value() ? nextFresh_ : graph.nextVertexId().value();
            if (fresh == sgVertexId::invalid_value)
                return fail(sgErrorCode::IdsExhausted, sgInvalidVertexId, text, line);
            nextFresh_ = fresh + 1;

            aliases_.emplaceBack(sgString(allocator_, alias), sgHashFnv1a64(alias.name, alias.nameEnd), sgVertexId{fresh});
            out_vertex = sgVertexId{fresh};
            return true;
        }

        char const* digits = text.name;
        char const* const end = text.name + length;
        if (sgNameStartsWith(text, "ν"))
            digits += sizeof("ν") - 1;
        else if (*digits == 'v')
            ++digits;

        uint32_t value = 0;
        auto const [last, ec] = std::from_chars(digits, end, value);
        if (digits == end || ec != std::errc{} || last != end || value == sgVertexId::invalid_value)
            return fail(sgErrorCode::Malformed, sgInvalidVertexId, text, line);

        out_vertex = value == 0 ? root_ : sgVertexId{value};
        return true;
    }

    auto Assembler::findAlias(sgName alias) const noexcept -> AliasIndex
    {
        uint32_t const length = sgNameLen(alias);
        uint64_t const hash = sgHashFnv1a64(alias.name, alias.name + length);

        for (uint32_t index = 0; index != aliases_.size(); ++index)
        {
            Alias const& entry = aliases_[AliasIndex{index}];
            if (entry.nameHash == hash && entry.name.equals(alias.name, length))
                return AliasIndex{index};
        }
        return sgInvalidIndex;
    }

    bool Assembler::parseData(sgName text)
    {
        scratch_.clear();

        uint32_t const length = sgNameLen(text);
        char const* const first = text.name;
        char const* const last = text.name + length;

        if (sgNameEquals(text, "--"))
            return true;

        char const* const slash = static_cast<char const*>(std::memchr(first, '/', length));
        if (slash == nullptr)
            return parseHex(first, last) && !scratch_.empty();

        sgName const kind{first, slash};
        char const* const body = slash + 1;

        if (sgNameEquals(kind, "bytes"))
            return parseHex(body, last);
        if (sgNameEquals(kind, "string"))
            return parseString(body, last);
        if (sgNameEquals(kind, "int"))
            return parseInt(body, last);
        if (sgNameEquals(kind, "float"))
            return parseFloat(body, last);
        if (sgNameEquals(kind, "bool"))
        {
            sgName const value{body, last};
            if (sgNameEquals(value, "true"))
                scratch_.pushBack(1);
            else if (sgNameEquals(value, "false"))
                scratch_.pushBack(0);
            else
                return false;
            return true;
        }

        return false;
    }

    bool Assembler::parseHex(char const* first, char const* last)
    {
        bool high = true;
        uint8_t octet = 0;

        for (char const* p = first; p != last; ++p)
        {
            if (isHexSeparator(*p))
            {
                // separators only between octets
                if (!high)
                    return false;
                continue;
            }
            if (!isHexDigit(*p))
                return false;

            if (high)
            {
                octet = static_cast<uint8_t>(hexValue(*p) << 4);
            }
            else
            {
                octet |= hexValue(*p);
                scratch_.pushBack(octet);
            }
            high = !high;
        }

        return high;
    }

    bool Assembler::parseString(char const* first, char const* last)
    {
        for (char const* p = first; p != last;)
        {
            char const c = *p++;
            if (c != '\\' || p == last)
            {
                scratch_.pushBack(static_cast<uint8_t>(c));
                continue;
            }

            char const escape = *p++;
            switch (escape)
            {
            case 'n': scratch_.pushBack('\n'); break;
            case 't': scratch_.pushBack('\t'); break;
            case 'r': scratch_.pushBack('\r'); break;
            case '\\':
            case '\'':
            case '"': scratch_.pushBack(static_cast<uint8_t>(escape)); break;
            case 'u': {
                if (last - p < 4)
                    return false;

                uint32_t code = 0;
                for (uint32_t index = 0; index != 4; ++index, ++p)
                {
                    if (!isHexDigit(*p))
                        return false;
                    code = (code << 4) | hexValue(*p);
                }

                if (code < 0x80)
                {
                    scratch_.pushBack(static_cast<uint8_t>(code));
                }
                else if (code < 0x800)
                {
                    scratch_.pushBack(static_cast<uint8_t>(0xc0 | (code >> 6)));
                    scratch_.pushBack(static_cast<uint8_t>(0x80 | (code & 0x3f)));
                }
                else
                {
                    scratch_.pushBack(static_cast<uint8_t>(0xe0 | (code >> 12)));
                    scratch_.pushBack(static_cast<uint8_t>(0x80 | ((code >> 6) & 0x3f)));
                    scratch_.pushBack(static_cast<uint8_t>(0x80 | (code & 0x3f)));
                }
                break;
            }
            default: return false;
            }
        }

        return true;
    }

    bool Assembler::parseInt(char const* first, char const* last)
    {
        if (first != last && *first == '+')
            ++first;

        int64_t value = 0;
        auto const [end, ec] = std::from_chars(first, last, value);
        if (first == last || ec != std::errc{} || end != last)
            return false;

        uint8_t bytes[8];
        sgStoreBigEndian64(static_cast<uint64_t>(value), bytes);
        scratch_.append(bytes, 8);
        return true;
    }

    bool Assembler::parseFloat(char const* first, char const* last)
    {
        if (first == last)
            return false;

        // strtod needs a terminated copy
        sgString const text(allocator_, first, last);
        char* end = nullptr;
        double const value = std::strtod(text.cStr(), &end);
        if (end != text.end())
            return false;

        uint8_t bytes[8];
        sgStoreBigEndian64(sgBitCast<uint64_t>(value), bytes);
        scratch_.append(bytes, 8);
        return true;
    }

    sgName Assembler::tokenText(Token const& token) const noexcept
    {
        return sgName{source_ + token.offset, source_ + token.offset + token.length};
    }

    auto Assembler::advance() noexcept -> Token const&
    {
        Token const& token = tokens_[nextToken_];
        if (token.type != TokenType::End)
            nextToken_ = TokenIndex{nextToken_.value() + 1};
        return token;
    }

    bool Assembler::fail(sgErrorCode code, sgVertexId vertex, sgName name, uint32_t line)
    {
        return fail(sgMakeError(code, vertex, name, line), line);
    }

    bool Assembler::fail(sgError error, uint32_t line)
    {
        error.line = line;
        errors_.pushBack(error);

        SG_LOG_DEBUG(logger_, logTag, "line {}: {} at ν{} '{}'", line, sgErrorCodeName(error.code), error.vertex.value(), error.name);
        return false;
    }
} // namespace surge
