#include "capsule/component_file.h"
#include "capsule/component_abi.h"
#include "capsule/crypto.h"

#include <elf.h>

#include <cstring>
#include <fstream>
#include <system_error>
#include <vector>

namespace capsule {

namespace {

bool fail(LoadError* err, LoadErrorKind kind, const std::string& msg) {
    if (err) {
        err->kind = kind;
        err->message = msg;
    }
    return false;
}

#if defined(__x86_64__)
constexpr uint16_t kHostMachine = EM_X86_64;
#elif defined(__aarch64__)
constexpr uint16_t kHostMachine = EM_AARCH64;
#else
constexpr uint16_t kHostMachine = EM_NONE;
#endif

bool in_bounds(size_t total, uint64_t off, uint64_t len) {
    return off <= total && len <= total - off;
}

template <typename T>
bool read_at(const std::string& bytes, uint64_t off, T* out) {
    if (!in_bounds(bytes.size(), off, sizeof(T))) return false;
    std::memcpy(out, bytes.data() + off, sizeof(T));
    return true;
}

// NUL-terminated string inside [base, base+size).
bool string_at(const std::string& bytes, uint64_t base, uint64_t size, uint64_t idx, std::string* out) {
    if (idx >= size || !in_bounds(bytes.size(), base, size)) return false;
    const char* start = bytes.data() + base + idx;
    const void* nul = std::memchr(start, '\0', static_cast<size_t>(size - idx));
    if (!nul) return false;
    out->assign(start, static_cast<const char*>(nul));
    return true;
}

} // namespace

bool read_component_file(const std::filesystem::path& path, size_t max_bytes,
                         std::string* bytes, LoadError* err) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return fail(err, LoadErrorKind::Malformed, "not a regular file: " + path.string());
    }
    auto sz = std::filesystem::file_size(path, ec);
    if (ec) return fail(err, LoadErrorKind::Malformed, "cannot stat " + path.string() + ": " + ec.message());
    if (max_bytes > 0 && sz > max_bytes) {
        return fail(err, LoadErrorKind::Malformed,
                    "component exceeds size limit (" + std::to_string(sz) + " > " + std::to_string(max_bytes) + " bytes)");
    }
    std::ifstream f(path, std::ios::binary);
    if (!f) return fail(err, LoadErrorKind::Malformed, "cannot open " + path.string());
    bytes->assign(static_cast<size_t>(sz), '\0');
    if (sz > 0 && !f.read(&(*bytes)[0], static_cast<std::streamsize>(sz))) {
        return fail(err, LoadErrorKind::Malformed, "short read on " + path.string());
    }
    return true;
}

bool inspect_component(const std::string& bytes, ComponentImage* out, LoadError* err) {
    Elf64_Ehdr eh;
    if (!read_at(bytes, 0, &eh) || std::memcmp(eh.e_ident, ELFMAG, SELFMAG) != 0) {
        return fail(err, LoadErrorKind::Malformed, "not an ELF binary");
    }
    if (eh.e_ident[EI_CLASS] != ELFCLASS64 || eh.e_ident[EI_DATA] != ELFDATA2LSB) {
        return fail(err, LoadErrorKind::Malformed, "not a 64-bit little-endian ELF binary");
    }
    if (eh.e_type != ET_DYN) return fail(err, LoadErrorKind::Malformed, "not a shared object");
    if (eh.e_shentsize != sizeof(Elf64_Shdr) || eh.e_shnum == 0 ||
        !in_bounds(bytes.size(), eh.e_shoff, static_cast<uint64_t>(eh.e_shnum) * sizeof(Elf64_Shdr)) ||
        eh.e_shstrndx >= eh.e_shnum) {
        return fail(err, LoadErrorKind::Malformed, "section header table out of bounds");
    }
    if (kHostMachine != EM_NONE && eh.e_machine != kHostMachine) {
        return fail(err, LoadErrorKind::UnsupportedInterface,
                    "built for ELF machine " + std::to_string(eh.e_machine) + ", host is " + std::to_string(kHostMachine));
    }

    std::vector<Elf64_Shdr> sections(eh.e_shnum);
    for (size_t i = 0; i < sections.size(); i++) {
        read_at(bytes, eh.e_shoff + i * sizeof(Elf64_Shdr), &sections[i]);
        const auto& s = sections[i];
        if (s.sh_type != SHT_NOBITS && s.sh_type != SHT_NULL && !in_bounds(bytes.size(), s.sh_offset, s.sh_size)) {
            return fail(err, LoadErrorKind::Malformed, "section " + std::to_string(i) + " out of bounds");
        }
    }
    const Elf64_Shdr& shstr = sections[eh.e_shstrndx];

    const Elf64_Shdr* iface = nullptr;
    const Elf64_Shdr* dynsym = nullptr;
    for (const auto& s : sections) {
        std::string name;
        if (!string_at(bytes, shstr.sh_offset, shstr.sh_size, s.sh_name, &name)) continue;
        if (name == CAPSULE_INTERFACE_SECTION) iface = &s;
        if (s.sh_type == SHT_DYNSYM) dynsym = &s;
    }

    if (!iface || iface->sh_type == SHT_NOBITS || iface->sh_size == 0) {
        return fail(err, LoadErrorKind::UnsupportedInterface, "no " CAPSULE_INTERFACE_SECTION " section");
    }
    std::string doc;
    if (!string_at(bytes, iface->sh_offset, iface->sh_size, 0, &doc) || doc.empty()) {
        return fail(err, LoadErrorKind::UnsupportedInterface, "interface section is not a NUL-terminated document");
    }

    if (!dynsym || dynsym->sh_entsize != sizeof(Elf64_Sym) || dynsym->sh_link >= sections.size()) {
        return fail(err, LoadErrorKind::UnsupportedInterface, "no dynamic symbol table");
    }
    const Elf64_Shdr& dynstr = sections[dynsym->sh_link];
    bool has_abi = false, has_call = false;
    const uint64_t nsyms = dynsym->sh_size / sizeof(Elf64_Sym);
    for (uint64_t i = 0; i < nsyms; i++) {
        Elf64_Sym sym;
        if (!read_at(bytes, dynsym->sh_offset + i * sizeof(Elf64_Sym), &sym)) break;
        if (sym.st_shndx == SHN_UNDEF || ELF64_ST_TYPE(sym.st_info) != STT_FUNC) continue;
        const unsigned bind = ELF64_ST_BIND(sym.st_info);
        if (bind != STB_GLOBAL && bind != STB_WEAK) continue;
        std::string name;
        if (!string_at(bytes, dynstr.sh_offset, dynstr.sh_size, sym.st_name, &name)) continue;
        if (name == CAPSULE_SYM_ABI_VERSION) has_abi = true;
        if (name == CAPSULE_SYM_CALL) has_call = true;
    }
    if (!has_abi || !has_call) {
        std::string missing = !has_abi ? CAPSULE_SYM_ABI_VERSION : CAPSULE_SYM_CALL;
        return fail(err, LoadErrorKind::UnsupportedInterface, "missing export " + missing);
    }

    out->digest = sha256_hex(bytes);
    out->interface_json = std::move(doc);
    out->size = bytes.size();
    return true;
}

} // namespace capsule
