#pragma once
/*
 * AsciiFold
 *
 * Notes only store 7-bit characters. Latin-1 letters with diacritics fold to
 * their base letter (é -> e, Æ -> A, ß -> s); anything else outside ASCII is '?'.
 */

char fold_to_ascii(char32_t cp);
